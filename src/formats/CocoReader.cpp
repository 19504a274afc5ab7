/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "CocoReader.hpp"

#include <climits>
#include <fstream>
#include <iostream>
#include <unordered_map>

#include "Errors.hpp"
#include "FileUtil.hpp"
#include "bbox/BboxUtil.hpp"

const nlohmann::json &CocoReader::getArray(const nlohmann::json &node, const std::string &key, const std::string &context)
{
    const auto it = node.find(key);
    if (it == node.end()) throw FormatError(context + ": missing key \"" + key + "\"");
    if (!it->is_array()) throw FormatError(context + ": \"" + key + "\" is not an array");
    return *it;
}

int CocoReader::getInt(const nlohmann::json &node, const std::string &key, const std::string &context)
{
    const auto it = node.find(key);
    if (it == node.end()) throw FormatError(context + ": missing key \"" + key + "\"");
    if (!it->is_number_integer()) throw FormatError(context + ": \"" + key + "\" is not an integer");

    // get<int>() は範囲外の値を黙って切り詰めるので先に確認する
    const bool inRange = it->is_number_unsigned() ? it->get<unsigned long long>() <= (unsigned long long)INT_MAX
                                                  : it->get<long long>() >= INT_MIN && it->get<long long>() <= INT_MAX;
    if (!inRange) throw FormatError(context + ": \"" + key + "\" is out of int range");
    return it->get<int>();
}

double CocoReader::getNumber(const nlohmann::json &node, const std::string &key, const std::string &context)
{
    const auto it = node.find(key);
    if (it == node.end()) throw FormatError(context + ": missing key \"" + key + "\"");
    if (!it->is_number()) throw FormatError(context + ": \"" + key + "\" is not a number");
    return it->get<double>();
}

std::string CocoReader::getString(const nlohmann::json &node, const std::string &key, const std::string &context)
{
    const auto it = node.find(key);
    if (it == node.end()) throw FormatError(context + ": missing key \"" + key + "\"");
    if (!it->is_string()) throw FormatError(context + ": \"" + key + "\" is not a string");
    return it->get<std::string>();
}

/// @brief COCO の [x, y, width, height] をコーナーフォーマットに変換する
BboxXyxy CocoReader::getBbox(const nlohmann::json &node, const std::string &context)
{
    const nlohmann::json &bbox = getArray(node, "bbox", context);
    if (bbox.size() != 4) throw FormatError(context + ": \"bbox\" must have 4 elements");
    for (const nlohmann::json &v : bbox)
    {
        if (!v.is_number()) throw FormatError(context + ": \"bbox\" contains a non-numeric value");
    }

    BboxXywh xywh;
    xywh.x = bbox[0].get<double>();
    xywh.y = bbox[1].get<double>();
    xywh.w = bbox[2].get<double>();
    xywh.h = bbox[3].get<double>();
    return BboxUtil::Xywh2Xyxy(xywh);
}

Dataset CocoReader::Read(const std::string &sourcePath)
{
    if (!FileUtil::IsRegularFile(sourcePath))
    {
        throw MissingResourceError("COCO annotation file doesn't exist: " + sourcePath);
    }

    std::cout << "Reading COCO: " << sourcePath << std::endl;

    nlohmann::json root;
    {
        std::ifstream fin(sourcePath);
        if (!fin)
        {
            throw FormatError("Couldn't open the COCO file: " + sourcePath);
        }
        try
        {
            fin >> root;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw FormatError(sourcePath + ": " + e.what());
        }
    }
    if (!root.is_object())
    {
        throw FormatError(sourcePath + ": top level is not an object");
    }

    const nlohmann::json &images = getArray(root, "images", sourcePath);
    const nlohmann::json &annotations = getArray(root, "annotations", sourcePath);
    const nlohmann::json &categories = getArray(root, "categories", sourcePath);

    Dataset dataset;

    const auto info = root.find("info");
    if (info != root.end())
    {
        if (!info->is_object()) throw FormatError(sourcePath + ": \"info\" is not an object");
        dataset.SetInfo(*info);
    }

    // Parse the categories (ids as given)
    for (size_t i = 0; i < categories.size(); i++)
    {
        const std::string context = sourcePath + ": categories[" + std::to_string(i) + "]";
        const nlohmann::json &cat = categories[i];
        if (!cat.is_object()) throw FormatError(context + " is not an object");

        Category category(getInt(cat, "id", context), getString(cat, "name", context));
        const auto super = cat.find("supercategory");
        if (super != cat.end() && super->is_string())
        {
            category.supercategory = super->get<std::string>();
        }
        dataset.AddCategory(category);
    }

    // Parse the images. width / height が無い場合はサイズ未知 (0) として後段の推定に任せる
    std::unordered_map<int, size_t> imageIndices;
    for (size_t i = 0; i < images.size(); i++)
    {
        const std::string context = sourcePath + ": images[" + std::to_string(i) + "]";
        const nlohmann::json &img = images[i];
        if (!img.is_object()) throw FormatError(context + " is not an object");

        const int id = getInt(img, "id", context);
        if (imageIndices.count(id))
        {
            throw FormatError(context + ": duplicate image id " + std::to_string(id));
        }

        const int width = img.contains("width") ? getInt(img, "width", context) : 0;
        const int height = img.contains("height") ? getInt(img, "height", context) : 0;

        imageIndices[id] = dataset.GetImages().size();
        dataset.AddImage(Image(getString(img, "file_name", context), width, height));
    }

    // Parse the bounding boxes
    std::vector<Image> &datasetImages = dataset.GetImages();
    for (size_t i = 0; i < annotations.size(); i++)
    {
        const std::string context = sourcePath + ": annotations[" + std::to_string(i) + "]";
        const nlohmann::json &ann = annotations[i];
        if (!ann.is_object()) throw FormatError(context + " is not an object");

        const int imageId = getInt(ann, "image_id", context);
        const int categoryId = getInt(ann, "category_id", context);
        const BboxXyxy bbox = getBbox(ann, context);

        const auto imageIt = imageIndices.find(imageId);
        if (imageIt == imageIndices.end())
        {
            throw ReferenceError(context + ": unknown image_id " + std::to_string(imageId));
        }
        if (!dataset.HasCategory(categoryId))
        {
            throw ReferenceError(context + ": unknown category_id " + std::to_string(categoryId));
        }

        Annotation annotation(bbox, categoryId, dataset.GetCategoryById(categoryId).name);
        if (ann.contains("area")) annotation.area = getNumber(ann, "area", context);
        if (ann.contains("iscrowd")) annotation.iscrowd = getInt(ann, "iscrowd", context);

        datasetImages[imageIt->second].AddAnnotation(annotation);
    }

    std::cout << "Images: " << dataset.GetImages().size() << ", Categories: " << dataset.GetCategories().size()
              << ", Annotations: " << dataset.NumAnnotations() << std::endl;

    return dataset;
}
