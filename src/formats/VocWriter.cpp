/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "VocWriter.hpp"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <set>

#include "Errors.hpp"
#include "FileUtil.hpp"

static std::string toPixel(const double value) { return std::to_string(std::lround(value)); }

VocWriter::VocWriter() { folder = "images"; }

void VocWriter::appendText(pugi::xml_node &parent, const char *name, const std::string &value)
{
    parent.append_child(name).text().set(value.c_str());
}

void VocWriter::buildDocument(const Image &image, pugi::xml_document &doc) const
{
    pugi::xml_node root = doc.append_child("annotation");
    appendText(root, "folder", folder);
    appendText(root, "filename", image.fileName);
    appendText(root, "path", image.fileName);

    pugi::xml_node source = root.append_child("source");
    appendText(source, "database", "Unknown");

    pugi::xml_node size = root.append_child("size");
    appendText(size, "width", std::to_string(image.width));
    appendText(size, "height", std::to_string(image.height));
    appendText(size, "depth", "3");

    appendText(root, "segmented", "0");

    for (const Annotation &annotation : image.annotations)
    {
        pugi::xml_node object = root.append_child("object");
        appendText(object, "name", annotation.categoryName);
        appendText(object, "pose", "Unspecified");
        appendText(object, "truncated", annotation.truncated ? "1" : "0");
        appendText(object, "difficult", annotation.difficult ? "1" : "0");

        pugi::xml_node bndbox = object.append_child("bndbox");
        appendText(bndbox, "xmin", toPixel(annotation.bbox.x0));
        appendText(bndbox, "ymin", toPixel(annotation.bbox.y0));
        appendText(bndbox, "xmax", toPixel(annotation.bbox.x1));
        appendText(bndbox, "ymax", toPixel(annotation.bbox.y1));
    }
}

void VocWriter::Write(const Dataset &dataset, const std::string &targetPath)
{
    if (!FileUtil::CreateDirectories(targetPath))
    {
        throw MissingResourceError("Couldn't create output directory: " + targetPath);
    }

    std::cout << "Writing VOC: " << targetPath << std::endl;

    std::set<std::string> writtenPaths;
    for (const Image &image : dataset.GetImages())
    {
        pugi::xml_document doc;
        buildDocument(image, doc);

        const std::string xmlPath = (std::filesystem::path(targetPath) / (FileUtil::GetStem(image.fileName) + ".xml")).string();
        if (!writtenPaths.insert(xmlPath).second)
        {
            std::cout << "Warning: " << image.fileName << " overwrites " << xmlPath << std::endl;
        }
        if (!doc.save_file(xmlPath.c_str(), "  "))
        {
            throw MissingResourceError("Couldn't write the XML file: " + xmlPath);
        }
    }
}
