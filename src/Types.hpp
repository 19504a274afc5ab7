/// @brief このファイルは、プロジェクト全体で使用されるドメインオブジェクトを定義します。
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


/// @brief Bounding box in corner format (absolute pixel coordinates)
struct BboxXyxy
{
    double x0; // xmin
    double y0; // ymin
    double x1; // xmax
    double y1; // ymax

    inline double x_center() const { return (x0 + x1) / 2.0; }
    inline double y_center() const { return (y0 + y1) / 2.0; }
    inline double Width() const { return x1 - x0; }
    inline double Height() const { return y1 - y0; }
    inline double Area() const { return Width() * Height(); }

    BboxXyxy() : x0(0.0), y0(0.0), x1(0.0), y1(0.0){};
    BboxXyxy(const double x0, const double y0, const double x1, const double y1) : x0(x0), y0(y0), x1(x1), y1(y1){};
};

/// @brief Bounding box in normalized center format (YOLO)
struct BboxCxcywh
{
    double xc; // 中心座標 [0, 1]
    double yc; // 中心座標 [0, 1]
    double w;  // 幅 [0, 1]
    double h;  // 高さ [0, 1]
};

/// @brief Bounding box in top-left + size format (COCO)
struct BboxXywh
{
    double x;
    double y;
    double w;
    double h;
};

/// @brief クラス定義
struct Category
{
    int id;
    std::string name;
    std::string supercategory; // 空文字は未設定

    Category() : id(0){};
    Category(const int id, const std::string &name, const std::string &supercategory = "")
        : id(id), name(name), supercategory(supercategory){};
};

/// @brief 1物体のアノテーション
struct Annotation
{
    BboxXyxy bbox;
    int categoryId;
    std::string categoryName; // categoryId の非正規化コピー
    bool difficult{false};
    bool truncated{false};
    int iscrowd{0};
    double area{-1.0}; // 負値は未設定。書き出し時に bbox から計算する

    Annotation() : categoryId(0){};
    Annotation(const BboxXyxy &bbox, const int categoryId, const std::string &categoryName)
        : bbox(bbox), categoryId(categoryId), categoryName(categoryName){};
    Annotation(const BboxXyxy &bbox, const int categoryId, const std::string &categoryName, const bool difficult,
               const bool truncated)
        : bbox(bbox), categoryId(categoryId), categoryName(categoryName), difficult(difficult), truncated(truncated){};

    double GetArea() const { return area < 0.0 ? bbox.Area() : area; }
};

/// @brief 画像とそのアノテーション
struct Image
{
    std::string fileName;
    int width;  // 0 は未知
    int height; // 0 は未知
    std::vector<Annotation> annotations;

    Image() : width(0), height(0){};
    Image(const std::string &fileName, const int width, const int height)
        : fileName(fileName), width(width), height(height){};

    bool IsSizeKnown() const { return width > 0 && height > 0; }

    void AddAnnotation(const Annotation &annotation)
    {
        this->annotations.push_back(annotation);
    }
};
