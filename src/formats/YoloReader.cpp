/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "YoloReader.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

#include "Errors.hpp"
#include "FileUtil.hpp"
#include "StringUtil.hpp"
#include "bbox/BboxUtil.hpp"

YoloReader::YoloReader(const std::string &imagesDir, const std::string &classesFile, const std::string &imageExt)
{
    this->imagesDir = imagesDir;
    this->classesFile = classesFile;
    this->imageExt = imageExt;
}

std::vector<std::string> YoloReader::readClassNames(const std::string &classesFile)
{
    std::ifstream fin(classesFile);
    if (!fin)
    {
        throw MissingResourceError("Couldn't open the classes file: " + classesFile);
    }

    // 空行は読み飛ばす。行番号 (空行除く) がクラスIDになる
    std::vector<std::string> classNames;
    std::string line;
    while (std::getline(fin, line))
    {
        const std::string name = StringUtil::Trim(line);
        if (!name.empty()) classNames.push_back(name);
    }
    return classNames;
}

/// @brief "<class_id> <x_center> <y_center> <width> <height>" を解析する
void YoloReader::parseLine(const std::string &line, const std::string &context, int &classId, BboxCxcywh &bbox)
{
    std::istringstream iss(line);
    std::vector<std::string> fields;
    std::string field;
    while (iss >> field)
    {
        fields.push_back(field);
    }

    if (fields.size() != 5)
    {
        throw FormatError(context + ": expected 5 fields but got " + std::to_string(fields.size()));
    }
    if (!StringUtil::ParseInt(fields[0], classId))
    {
        throw FormatError(context + ": invalid class id \"" + fields[0] + "\"");
    }

    double values[4];
    for (int i = 0; i < 4; i++)
    {
        if (!StringUtil::ParseDouble(fields[i + 1], values[i]))
        {
            throw FormatError(context + ": invalid number \"" + fields[i + 1] + "\"");
        }
    }
    bbox.xc = values[0];
    bbox.yc = values[1];
    bbox.w = values[2];
    bbox.h = values[3];
}

void YoloReader::readLabelFile(const std::string &labelFile, const Dataset &dataset, Image &image) const
{
    std::ifstream fin(labelFile);
    if (!fin)
    {
        throw MissingResourceError("Couldn't open the label file: " + labelFile);
    }

    const int numClasses = (int)dataset.GetCategories().size();
    std::string line;
    int lineNumber = 0;
    while (std::getline(fin, line))
    {
        lineNumber++;
        if (StringUtil::Trim(line).empty()) continue;

        const std::string context = labelFile + ":" + std::to_string(lineNumber);
        int classId;
        BboxCxcywh normalized;
        parseLine(line, context, classId, normalized);

        if (classId < 0 || classId >= numClasses)
        {
            throw FormatError(context + ": class id " + std::to_string(classId) + " is out of range [0, " +
                              std::to_string(numClasses) + ")");
        }

        const BboxXyxy bbox = BboxUtil::Cxcywh2Xyxy(normalized, image.width, image.height);
        image.AddAnnotation(Annotation(bbox, classId, dataset.GetCategoryById(classId).name));
    }
}

Dataset YoloReader::Read(const std::string &sourcePath)
{
    if (!FileUtil::IsDirectory(sourcePath))
    {
        throw MissingResourceError("YOLO labels directory doesn't exist: " + sourcePath);
    }
    if (!FileUtil::IsDirectory(imagesDir))
    {
        throw MissingResourceError("Images directory doesn't exist: " + imagesDir);
    }
    if (!FileUtil::IsRegularFile(classesFile))
    {
        throw MissingResourceError("Classes file doesn't exist: " + classesFile);
    }

    std::cout << "Reading YOLO: " << sourcePath << " (images: " << imagesDir << ", classes: " << classesFile << ")"
              << std::endl;

    Dataset dataset;
    const std::vector<std::string> classNames = readClassNames(classesFile);
    for (size_t i = 0; i < classNames.size(); i++)
    {
        dataset.AddCategory(Category((int)i, classNames[i]));
    }

    for (const std::string &labelFile : FileUtil::GetFilesWithExtension(sourcePath, ".txt"))
    {
        // classes.txt がラベルと同じディレクトリに置かれている場合
        if (FileUtil::IsSameFile(labelFile, classesFile)) continue;

        const std::string stem = FileUtil::GetStem(labelFile);
        const std::string imagePath = FileUtil::FindImageFile(imagesDir, stem, imageExt);
        if (imagePath.empty())
        {
            throw MissingResourceError("No image for label file " + labelFile + " in " + imagesDir);
        }

        int width = 0;
        int height = 0;
        if (!FileUtil::ReadImageSize(imagePath, width, height))
        {
            throw MissingResourceError("Couldn't read the image size: " + imagePath);
        }

        Image image(FileUtil::GetFileName(imagePath), width, height);
        readLabelFile(labelFile, dataset, image);
        dataset.AddImage(image);
    }

    std::cout << "Images: " << dataset.GetImages().size() << ", Categories: " << dataset.GetCategories().size()
              << ", Annotations: " << dataset.NumAnnotations() << std::endl;

    return dataset;
}
