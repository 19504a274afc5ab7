/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <vector>

#include "IFormatReader.hpp"

/// @brief YOLO 形式の読み込み
/// ラベルは正規化座標で画像サイズを持たないため、画像ディレクトリから対応する画像を開いてサイズを得る
class YoloReader final : public IFormatReader
{
private:
    std::string imagesDir;
    std::string classesFile;
    std::string imageExt;

    static std::vector<std::string> readClassNames(const std::string &classesFile);
    static void parseLine(const std::string &line, const std::string &context, int &classId, BboxCxcywh &bbox);
    void readLabelFile(const std::string &labelFile, const Dataset &dataset, Image &image) const;

public:
    YoloReader(const std::string &imagesDir, const std::string &classesFile, const std::string &imageExt = ".jpg");
    ~YoloReader(){};

    /// @param sourcePath ラベル (.txt) ファイルのディレクトリ
    Dataset Read(const std::string &sourcePath) override;
};
