/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "Converter.hpp"

#include <filesystem>
#include <iostream>

#include "Errors.hpp"
#include "FileUtil.hpp"
#include "StringUtil.hpp"
#include "formats/CocoReader.hpp"
#include "formats/CocoWriter.hpp"
#include "formats/VocReader.hpp"
#include "formats/VocWriter.hpp"
#include "formats/YoloReader.hpp"
#include "formats/YoloWriter.hpp"

AnnotationFormat Converter::ParseFormat(const std::string &name)
{
    const std::string lower = StringUtil::ToLower(name);
    if (lower == "coco") return AnnotationFormat::Coco;
    if (lower == "yolo") return AnnotationFormat::Yolo;
    if (lower == "voc") return AnnotationFormat::Voc;

    throw UnsupportedFormatError("\"" + name + "\" (supported: coco, yolo, voc)");
}

std::string Converter::FormatName(const AnnotationFormat format)
{
    switch (format)
    {
    case AnnotationFormat::Coco:
        return "COCO";
    case AnnotationFormat::Yolo:
        return "YOLO";
    case AnnotationFormat::Voc:
        return "VOC";
    }
    throw UnsupportedFormatError("unknown format value " + std::to_string((int)format));
}

std::unique_ptr<IFormatReader> Converter::createReader(const AnnotationFormat format, const ConversionOptions &options)
{
    switch (format)
    {
    case AnnotationFormat::Coco:
        return std::make_unique<CocoReader>();
    case AnnotationFormat::Yolo:
        if (options.imagesDir.empty() || options.classesFile.empty())
        {
            throw MissingResourceError("YOLO input requires an images directory and a classes file");
        }
        return std::make_unique<YoloReader>(options.imagesDir, options.classesFile, options.imageExt);
    case AnnotationFormat::Voc:
        return std::make_unique<VocReader>();
    }
    throw UnsupportedFormatError("unknown format value " + std::to_string((int)format));
}

std::unique_ptr<IFormatWriter> Converter::createWriter(const AnnotationFormat format, const ConversionOptions &options)
{
    switch (format)
    {
    case AnnotationFormat::Coco:
        return std::make_unique<CocoWriter>();
    case AnnotationFormat::Yolo:
        return std::make_unique<YoloWriter>(options.outputClassesFile);
    case AnnotationFormat::Voc:
        return std::make_unique<VocWriter>();
    }
    throw UnsupportedFormatError("unknown format value " + std::to_string((int)format));
}

/// @brief カテゴリ一覧を唯一の正とし、ID で引けないアノテーションはエラーにする。
/// 名前キーの VOC と ID キーの COCO / YOLO のどちらへ書き出しても同じ対応になるよう名前を引き直す
void Converter::reconcileCategories(Dataset &dataset)
{
    for (Image &image : dataset.GetImages())
    {
        for (Annotation &annotation : image.annotations)
        {
            annotation.categoryName = dataset.GetCategoryById(annotation.categoryId).name;
        }
    }
}

void Converter::inferImageSizes(Dataset &dataset, const ConversionOptions &options)
{
    for (Image &image : dataset.GetImages())
    {
        if (image.IsSizeKnown()) continue;

        if (options.imagesDir.empty())
        {
            std::cout << "Image size is unknown: " << image.fileName << std::endl;
            continue;
        }

        std::string imagePath = (std::filesystem::path(options.imagesDir) / image.fileName).string();
        if (!FileUtil::IsRegularFile(imagePath))
        {
            imagePath = FileUtil::FindImageFile(options.imagesDir, FileUtil::GetStem(image.fileName), options.imageExt);
        }

        int width = 0;
        int height = 0;
        if (imagePath.empty() || !FileUtil::ReadImageSize(imagePath, width, height))
        {
            std::cout << "Couldn't infer the image size of " << image.fileName << " from " << options.imagesDir
                      << std::endl;
            continue;
        }
        image.width = width;
        image.height = height;
    }
}

Dataset Converter::Read(const AnnotationFormat format, const std::string &sourcePath, const ConversionOptions &options) const
{
    std::unique_ptr<IFormatReader> reader = createReader(format, options);
    return reader->Read(sourcePath);
}

void Converter::Write(const AnnotationFormat format, const Dataset &dataset, const std::string &targetPath,
                      const ConversionOptions &options) const
{
    std::unique_ptr<IFormatWriter> writer = createWriter(format, options);
    writer->Write(dataset, targetPath);
}

void Converter::Reconcile(Dataset &dataset, const ConversionOptions &options) const
{
    reconcileCategories(dataset);
    inferImageSizes(dataset, options);
}

void Converter::Convert(const std::string &sourceFormat, const std::string &targetFormat, const std::string &sourcePath,
                        const std::string &targetPath, const ConversionOptions &options, ConversionSummary &summary)
{
    // 読み込みを始める前に両方のフォーマットを検証する
    const AnnotationFormat source = ParseFormat(sourceFormat);
    const AnnotationFormat target = ParseFormat(targetFormat);

    Dataset dataset = Read(source, sourcePath, options);
    Reconcile(dataset, options);
    Write(target, dataset, targetPath, options);

    summary.numImages = dataset.GetImages().size();
    summary.numCategories = dataset.GetCategories().size();
    summary.numAnnotations = dataset.NumAnnotations();
}

void Converter::Convert(const std::string &sourceFormat, const std::string &targetFormat, const std::string &sourcePath,
                        const std::string &targetPath, const ConversionOptions &options)
{
    ConversionSummary summary;
    Convert(sourceFormat, targetFormat, sourcePath, targetPath, options, summary);
}
