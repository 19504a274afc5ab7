/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <stdexcept>
#include <string>

/// @brief アノテーション変換で発生するエラーの基底クラス
class AnnotationError : public std::runtime_error
{
public:
    explicit AnnotationError(const std::string &message) : std::runtime_error(message) {}
};

/// @brief 入力ファイルの構文・スキーマ違反
class FormatError : public AnnotationError
{
public:
    explicit FormatError(const std::string &message) : AnnotationError("Format error: " + message) {}
};

/// @brief 画像・カテゴリIDへの参照が解決できない
class ReferenceError : public AnnotationError
{
public:
    explicit ReferenceError(const std::string &message) : AnnotationError("Reference error: " + message) {}
};

/// @brief 必要なファイル・ディレクトリが存在しない (classes.txt, 対応する画像など)
class MissingResourceError : public AnnotationError
{
public:
    explicit MissingResourceError(const std::string &message) : AnnotationError("Missing resource: " + message) {}
};

class DuplicateCategoryError : public AnnotationError
{
public:
    explicit DuplicateCategoryError(const std::string &message) : AnnotationError("Duplicate category: " + message) {}
};

class CategoryNotFoundError : public AnnotationError
{
public:
    explicit CategoryNotFoundError(const std::string &message) : AnnotationError("Category not found: " + message) {}
};

class UnsupportedFormatError : public AnnotationError
{
public:
    explicit UnsupportedFormatError(const std::string &message) : AnnotationError("Unsupported format: " + message) {}
};

/// @brief 処理に必要なデータがまだ揃っていない (例: 画像サイズ未知のまま YOLO を書き出す)
class InvalidStateError : public AnnotationError
{
public:
    explicit InvalidStateError(const std::string &message) : AnnotationError("Invalid state: " + message) {}
};
