/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <memory>
#include <string>

#include "dataset/Dataset.hpp"
#include "formats/IFormatReader.hpp"
#include "formats/IFormatWriter.hpp"

/// @brief 対応しているアノテーションフォーマット
enum class AnnotationFormat
{
    Coco,
    Yolo,
    Voc
};

/// @brief フォーマット固有の補助入出力
struct ConversionOptions
{
    std::string imagesDir;         // YOLO 読み込み時は必須。サイズ未知の画像の推定にも使う
    std::string classesFile;       // YOLO 読み込み時は必須
    std::string outputClassesFile; // YOLO 書き出し時。空ならラベルディレクトリの親の classes.txt
    std::string imageExt;          // YOLO ラベルに対応する画像の拡張子

    ConversionOptions() : imageExt(".jpg"){};
};

struct ConversionSummary
{
    size_t numImages{0};
    size_t numCategories{0};
    size_t numAnnotations{0};
};

/// @brief 入力フォーマットの読み込み、フォーマット間の整合、出力フォーマットへの書き出しを行うクラス
/// 3つのフォーマットをすべて知っているのはこのクラスだけ
class Converter
{
private:
    static std::unique_ptr<IFormatReader> createReader(const AnnotationFormat format, const ConversionOptions &options);
    static std::unique_ptr<IFormatWriter> createWriter(const AnnotationFormat format, const ConversionOptions &options);

    static void reconcileCategories(Dataset &dataset);
    static void inferImageSizes(Dataset &dataset, const ConversionOptions &options);

public:
    Converter(){};
    ~Converter(){};

    /// @brief "coco" / "yolo" / "voc" (大文字小文字は区別しない)。それ以外は UnsupportedFormatError
    static AnnotationFormat ParseFormat(const std::string &name);
    static std::string FormatName(const AnnotationFormat format);

    Dataset Read(const AnnotationFormat format, const std::string &sourcePath, const ConversionOptions &options) const;
    void Write(const AnnotationFormat format, const Dataset &dataset, const std::string &targetPath,
               const ConversionOptions &options) const;

    /// @brief 読み込んだ Dataset を書き出し前に整える
    /// - 全アノテーションの categoryId がカテゴリ一覧に存在することを確認し、categoryName をカテゴリ一覧から引き直す
    /// - サイズ未知の画像を options.imagesDir から推定する
    void Reconcile(Dataset &dataset, const ConversionOptions &options) const;

    void Convert(const std::string &sourceFormat, const std::string &targetFormat, const std::string &sourcePath,
                 const std::string &targetPath, const ConversionOptions &options, ConversionSummary &summary);
    void Convert(const std::string &sourceFormat, const std::string &targetFormat, const std::string &sourcePath,
                 const std::string &targetPath, const ConversionOptions &options);
};
