/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include "IFormatWriter.hpp"

/// @brief COCO 形式の書き出し
/// 画像ID・アノテーションIDは 1 から振り直す。difficult / truncated は COCO に存在しないので捨てる
class CocoWriter final : public IFormatWriter
{
private:
    int indent;

public:
    CocoWriter();
    ~CocoWriter(){};

    void SetIndent(const int indent) { this->indent = indent; }

    /// @param targetPath 出力する JSON ファイル
    void Write(const Dataset &dataset, const std::string &targetPath) override;
};
