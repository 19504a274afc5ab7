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

#include "IFormatWriter.hpp"

/// @brief Pascal VOC 形式の書き出し。画像ごとに "<stem>.xml" を作る
/// bndbox は最も近い整数ピクセルに丸める
class VocWriter final : public IFormatWriter
{
private:
    std::string folder;

    static void appendText(pugi::xml_node &parent, const char *name, const std::string &value);
    void buildDocument(const Image &image, pugi::xml_document &doc) const;

public:
    VocWriter();
    ~VocWriter(){};

    void SetFolder(const std::string &folder) { this->folder = folder; }

    /// @param targetPath XML を書き出すディレクトリ
    void Write(const Dataset &dataset, const std::string &targetPath) override;
};
