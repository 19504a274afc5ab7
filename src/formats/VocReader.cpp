/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "VocReader.hpp"

#include <cmath>
#include <iostream>

#include "Errors.hpp"
#include "FileUtil.hpp"
#include "StringUtil.hpp"

pugi::xml_node VocReader::getChild(const pugi::xml_node &node, const char *name, const std::string &context)
{
    const pugi::xml_node child = node.child(name);
    if (!child)
    {
        throw FormatError(context + ": missing <" + name + ">");
    }
    return child;
}

std::string VocReader::getText(const pugi::xml_node &node, const char *name, const std::string &context)
{
    const std::string text = StringUtil::Trim(getChild(node, name, context).text().get());
    if (text.empty())
    {
        throw FormatError(context + ": <" + name + "> is empty");
    }
    return text;
}

double VocReader::getNumber(const pugi::xml_node &node, const char *name, const std::string &context)
{
    const std::string text = getText(node, name, context);
    double value;
    if (!StringUtil::ParseDouble(text, value))
    {
        throw FormatError(context + ": <" + name + "> is not a number: \"" + text + "\"");
    }
    return value;
}

/// @brief difficult / truncated を読む。要素が無い、または空なら false
bool VocReader::getFlag(const pugi::xml_node &node, const char *name, const std::string &context)
{
    const std::string text = StringUtil::ToLower(StringUtil::Trim(node.child(name).text().get()));
    if (text.empty() || text == "false") return false;
    if (text == "true") return true;

    double value;
    if (!StringUtil::ParseDouble(text, value))
    {
        throw FormatError(context + ": <" + name + "> is not a flag: \"" + text + "\"");
    }
    return value != 0.0;
}

int VocReader::resolveCategoryId(Dataset &dataset, const std::string &name)
{
    for (const Category &category : dataset.GetCategories())
    {
        if (category.name == name) return category.id;
    }

    // このリーダーが振る ID は 0 からの連番なので、件数が次の ID になる
    const int id = (int)dataset.GetCategories().size();
    dataset.AddCategory(Category(id, name));
    return id;
}

void VocReader::readXmlFile(const std::string &xmlFile, Dataset &dataset) const
{
    pugi::xml_document doc;
    const pugi::xml_parse_result result = doc.load_file(xmlFile.c_str());
    if (!result)
    {
        throw FormatError(xmlFile + ": " + result.description() + " (offset " + std::to_string(result.offset) + ")");
    }

    const pugi::xml_node root = getChild(doc, "annotation", xmlFile);
    const pugi::xml_node size = getChild(root, "size", xmlFile);

    Image image(getText(root, "filename", xmlFile), (int)std::lround(getNumber(size, "width", xmlFile)),
                (int)std::lround(getNumber(size, "height", xmlFile)));

    int objectIndex = 0;
    for (const pugi::xml_node &object : root.children("object"))
    {
        const std::string context = xmlFile + ": object[" + std::to_string(objectIndex++) + "]";
        const std::string name = getText(object, "name", context);
        const pugi::xml_node bndbox = getChild(object, "bndbox", context);

        const BboxXyxy bbox(getNumber(bndbox, "xmin", context), getNumber(bndbox, "ymin", context),
                            getNumber(bndbox, "xmax", context), getNumber(bndbox, "ymax", context));

        const int categoryId = resolveCategoryId(dataset, name);
        image.AddAnnotation(
            Annotation(bbox, categoryId, name, getFlag(object, "difficult", context), getFlag(object, "truncated", context)));
    }

    dataset.AddImage(image);
}

Dataset VocReader::Read(const std::string &sourcePath)
{
    if (!FileUtil::IsDirectory(sourcePath))
    {
        throw MissingResourceError("VOC annotations directory doesn't exist: " + sourcePath);
    }

    std::cout << "Reading VOC: " << sourcePath << std::endl;

    Dataset dataset;
    for (const std::string &xmlFile : FileUtil::GetFilesWithExtension(sourcePath, ".xml"))
    {
        readXmlFile(xmlFile, dataset);
    }

    std::cout << "Images: " << dataset.GetImages().size() << ", Categories: " << dataset.GetCategories().size()
              << ", Annotations: " << dataset.NumAnnotations() << std::endl;

    return dataset;
}
