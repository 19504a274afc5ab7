/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <map>

#include "IFormatWriter.hpp"

/// @brief YOLO 形式の書き出し
/// 画像ごとに "<stem>.txt" を作り、クラス名を ID 順に並べた classes ファイルを併せて書き出す。
/// 出力するクラスIDは classes ファイルの行番号 (0始まり) で、入力側の ID が連番でなくても詰める
class YoloWriter final : public IFormatWriter
{
private:
    std::string classesFile;
    int precision; // 正規化座標の小数点以下桁数

    static std::map<int, int> makeClassIndices(const std::vector<Category> &sortedCategories);
    static void writeClassesFile(const std::string &classesFile, const std::vector<Category> &sortedCategories);

public:
    /// @param classesFile 空の場合はラベルディレクトリの親に classes.txt を作る
    YoloWriter(const std::string &classesFile = "");
    ~YoloWriter(){};

    void SetPrecision(const int precision) { this->precision = precision; }
    int GetPrecision() const { return precision; }

    /// @brief 実際に書き出す classes ファイルのパス
    std::string GetClassesFilePath(const std::string &targetPath) const;

    /// @param targetPath ラベル (.txt) を書き出すディレクトリ
    void Write(const Dataset &dataset, const std::string &targetPath) override;
};
