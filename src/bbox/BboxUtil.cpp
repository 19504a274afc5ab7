/*
 * (c) 2021 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "BboxUtil.hpp"

/// @brief コーナーフォーマットのバウンディングボックスを正規化済み中心フォーマットに変換する
BboxCxcywh BboxUtil::Xyxy2Cxcywh(const BboxXyxy input, const int imageWidth, const int imageHeight)
{
    const double w = input.x1 - input.x0;
    const double h = input.y1 - input.y0;
    BboxCxcywh ret;

    ret.xc = (input.x0 + w / 2) / imageWidth;
    ret.yc = (input.y0 + h / 2) / imageHeight;
    ret.w = w / imageWidth;
    ret.h = h / imageHeight;
    return ret;
}

/// @brief 正規化済み中心フォーマットのバウンディングボックスをコーナーフォーマットに変換する
BboxXyxy BboxUtil::Cxcywh2Xyxy(const BboxCxcywh input, const int imageWidth, const int imageHeight)
{
    const double w = input.w * imageWidth;
    const double h = input.h * imageHeight;
    const double xc = input.xc * imageWidth;
    const double yc = input.yc * imageHeight;
    BboxXyxy ret;

    ret.x0 = xc - w / 2;
    ret.y0 = yc - h / 2;
    ret.x1 = xc + w / 2;
    ret.y1 = yc + h / 2;

    return ret;
}

BboxXywh BboxUtil::Xyxy2Xywh(const BboxXyxy input)
{
    BboxXywh ret;
    ret.x = input.x0;
    ret.y = input.y0;
    ret.w = input.x1 - input.x0;
    ret.h = input.y1 - input.y0;
    return ret;
}

BboxXyxy BboxUtil::Xywh2Xyxy(const BboxXywh input) { return BboxXyxy(input.x, input.y, input.x + input.w, input.y + input.h); }
