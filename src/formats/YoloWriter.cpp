/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "YoloWriter.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <set>

#include "Errors.hpp"
#include "FileUtil.hpp"
#include "bbox/BboxUtil.hpp"

YoloWriter::YoloWriter(const std::string &classesFile)
{
    this->classesFile = classesFile;
    precision = 6;
}

std::string YoloWriter::GetClassesFilePath(const std::string &targetPath) const
{
    if (!classesFile.empty()) return classesFile;

    // ex) "out/labels" -> "out/classes.txt"
    const std::filesystem::path labelsDir = std::filesystem::path(targetPath).lexically_normal();
    std::filesystem::path parent = labelsDir.has_filename() ? labelsDir.parent_path() : labelsDir.parent_path().parent_path();
    return (parent / "classes.txt").string();
}

std::map<int, int> YoloWriter::makeClassIndices(const std::vector<Category> &sortedCategories)
{
    std::map<int, int> classIndices;
    for (size_t i = 0; i < sortedCategories.size(); i++)
    {
        classIndices[sortedCategories[i].id] = (int)i;
    }
    return classIndices;
}

void YoloWriter::writeClassesFile(const std::string &classesFile, const std::vector<Category> &sortedCategories)
{
    if (!FileUtil::CreateParentDirectories(classesFile))
    {
        throw MissingResourceError("Couldn't create output directory for: " + classesFile);
    }

    std::ofstream fout(classesFile);
    if (!fout)
    {
        throw MissingResourceError("Couldn't open the classes file: " + classesFile);
    }
    for (const Category &category : sortedCategories)
    {
        fout << category.name << "\n";
    }
    fout.flush();
    if (!fout)
    {
        throw MissingResourceError("Couldn't write the classes file: " + classesFile);
    }
}

void YoloWriter::Write(const Dataset &dataset, const std::string &targetPath)
{
    // 正規化には画像サイズが必要なので、何か書き出す前に確認する
    for (const Image &image : dataset.GetImages())
    {
        if (!image.IsSizeKnown())
        {
            throw InvalidStateError("image size of " + image.fileName + " is unknown; cannot normalize bboxes");
        }
    }

    if (!FileUtil::CreateDirectories(targetPath))
    {
        throw MissingResourceError("Couldn't create output directory: " + targetPath);
    }

    const std::string classesPath = GetClassesFilePath(targetPath);
    std::cout << "Writing YOLO: " << targetPath << " (classes: " << classesPath << ")" << std::endl;

    std::vector<Category> sortedCategories = dataset.GetCategories();
    std::stable_sort(sortedCategories.begin(), sortedCategories.end(),
                     [](const Category &a, const Category &b) { return a.id < b.id; });
    const std::map<int, int> classIndices = makeClassIndices(sortedCategories);

    writeClassesFile(classesPath, sortedCategories);

    std::set<std::string> writtenPaths;
    for (const Image &image : dataset.GetImages())
    {
        const std::string labelPath = (std::filesystem::path(targetPath) / (FileUtil::GetStem(image.fileName) + ".txt")).string();
        if (!writtenPaths.insert(labelPath).second)
        {
            std::cout << "Warning: " << image.fileName << " overwrites " << labelPath << std::endl;
        }
        std::ofstream fout(labelPath);
        if (!fout)
        {
            throw MissingResourceError("Couldn't open the label file: " + labelPath);
        }
        fout << std::fixed << std::setprecision(precision);

        for (const Annotation &annotation : image.annotations)
        {
            const auto it = classIndices.find(annotation.categoryId);
            if (it == classIndices.end())
            {
                throw CategoryNotFoundError("id " + std::to_string(annotation.categoryId) + " in " + image.fileName);
            }

            const BboxCxcywh normalized = BboxUtil::Xyxy2Cxcywh(annotation.bbox, image.width, image.height);
            fout << it->second << " " << normalized.xc << " " << normalized.yc << " " << normalized.w << " "
                 << normalized.h << "\n";
        }
        fout.flush();
        if (!fout)
        {
            throw MissingResourceError("Couldn't write the label file: " + labelPath);
        }
    }
}
