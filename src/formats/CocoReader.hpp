/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include "IFormatReader.hpp"
#include "nlohmann/json.hpp"

/// @brief COCO 形式 (images / annotations / categories を持つ単一の JSON) の読み込み
class CocoReader final : public IFormatReader
{
private:
    static const nlohmann::json &getArray(const nlohmann::json &node, const std::string &key, const std::string &context);
    static int getInt(const nlohmann::json &node, const std::string &key, const std::string &context);
    static double getNumber(const nlohmann::json &node, const std::string &key, const std::string &context);
    static std::string getString(const nlohmann::json &node, const std::string &key, const std::string &context);
    static BboxXyxy getBbox(const nlohmann::json &node, const std::string &context);

public:
    CocoReader(){};
    ~CocoReader(){};

    /// @param sourcePath COCO JSON ファイル
    Dataset Read(const std::string &sourcePath) override;
};
