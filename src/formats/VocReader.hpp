/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <pugixml.hpp>

#include "IFormatReader.hpp"

/// @brief Pascal VOC 形式 (画像ごとの XML) の読み込み
/// VOC はクラスを名前だけで持つので、初めて現れた名前に次の ID (0, 1, 2, ...) を振ってカテゴリ化する
class VocReader final : public IFormatReader
{
private:
    static pugi::xml_node getChild(const pugi::xml_node &node, const char *name, const std::string &context);
    static std::string getText(const pugi::xml_node &node, const char *name, const std::string &context);
    static double getNumber(const pugi::xml_node &node, const char *name, const std::string &context);
    static bool getFlag(const pugi::xml_node &node, const char *name, const std::string &context);
    static int resolveCategoryId(Dataset &dataset, const std::string &name);

    void readXmlFile(const std::string &xmlFile, Dataset &dataset) const;

public:
    VocReader(){};
    ~VocReader(){};

    /// @param sourcePath XML ファイルのディレクトリ
    Dataset Read(const std::string &sourcePath) override;
};
