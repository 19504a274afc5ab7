/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "CocoWriter.hpp"

#include <fstream>
#include <iostream>

#include "Errors.hpp"
#include "FileUtil.hpp"
#include "MathUtil.hpp"
#include "bbox/BboxUtil.hpp"
#include "nlohmann/json.hpp"

// 浮動小数点の誤差 (199.99999999997 など) を出力に残さないための桁数
static constexpr int kCoordinateDigits = 6;

CocoWriter::CocoWriter() { indent = 2; }

void CocoWriter::Write(const Dataset &dataset, const std::string &targetPath)
{
    if (!FileUtil::CreateParentDirectories(targetPath))
    {
        throw MissingResourceError("Couldn't create output directory for: " + targetPath);
    }

    std::cout << "Writing COCO: " << targetPath << std::endl;

    nlohmann::json root;
    root["info"] = dataset.GetInfo();
    root["licenses"] = nlohmann::json::array();
    root["categories"] = nlohmann::json::array();
    root["images"] = nlohmann::json::array();
    root["annotations"] = nlohmann::json::array();

    for (const Category &category : dataset.GetCategories())
    {
        nlohmann::json cat = {{"id", category.id}, {"name", category.name}};
        if (!category.supercategory.empty())
        {
            cat["supercategory"] = category.supercategory;
        }
        root["categories"].push_back(cat);
    }

    int imageId = 1;
    int annotationId = 1;
    for (const Image &image : dataset.GetImages())
    {
        const nlohmann::json img = {
            {"id", imageId}, {"file_name", image.fileName}, {"width", image.width}, {"height", image.height}};
        root["images"].push_back(img);

        for (const Annotation &annotation : image.annotations)
        {
            const BboxXywh xywh = BboxUtil::Xyxy2Xywh(annotation.bbox);
            nlohmann::json ann;
            ann["id"] = annotationId++;
            ann["image_id"] = imageId;
            ann["category_id"] = annotation.categoryId;
            ann["bbox"] = {MathUtil::RoundTo(xywh.x, kCoordinateDigits), MathUtil::RoundTo(xywh.y, kCoordinateDigits),
                           MathUtil::RoundTo(xywh.w, kCoordinateDigits), MathUtil::RoundTo(xywh.h, kCoordinateDigits)};
            ann["area"] = MathUtil::RoundTo(annotation.GetArea(), kCoordinateDigits);
            ann["iscrowd"] = annotation.iscrowd;
            ann["segmentation"] = nlohmann::json::array();
            root["annotations"].push_back(ann);
        }
        imageId++;
    }

    std::ofstream fout(targetPath);
    if (!fout)
    {
        throw MissingResourceError("Couldn't open the output file: " + targetPath);
    }
    fout << root.dump(indent) << std::endl;
    if (!fout)
    {
        throw MissingResourceError("Couldn't write the output file: " + targetPath);
    }
}
