/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <string>
#include <vector>

#include "Types.hpp"
#include "nlohmann/json.hpp"

/// @brief フォーマット非依存のデータセット。画像とカテゴリを所有する。
/// すべての Annotation::categoryId は同じ Dataset 内の Category に解決できなければならない。
class Dataset
{
private:
    std::vector<Image> images;
    std::vector<Category> categories;
    nlohmann::json info; // COCO の "info" をそのまま保持する。他のフォーマットでは空

public:
    Dataset() : info(nlohmann::json::object()){};
    ~Dataset(){};

    /// @brief カテゴリを追加する。同じ id が既にあれば DuplicateCategoryError
    void AddCategory(const Category &category);

    /// @brief 画像を末尾に追加する。ファイル名の重複は検査しない
    void AddImage(const Image &image);

    bool HasCategory(const int id) const;

    /// @throw CategoryNotFoundError
    const Category &GetCategoryById(const int id) const;
    /// @throw CategoryNotFoundError
    const Category &GetCategoryByName(const std::string &name) const;

    const std::vector<Image> &GetImages() const { return images; }
    std::vector<Image> &GetImages() { return images; }
    const std::vector<Category> &GetCategories() const { return categories; }

    void SetInfo(const nlohmann::json &info) { this->info = info; }
    const nlohmann::json &GetInfo() const { return info; }

    size_t NumAnnotations() const;
};
