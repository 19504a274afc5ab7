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

/// @brief ファイル・ディレクトリ操作のユーティリティ
namespace FileUtil
{
    /// @brief ex) "dir1/dir2/stem.ext" -> "stem"
    std::string GetStem(const std::string &filePath);

    /// @brief ex) "dir1/dir2/stem.ext" -> "stem.ext"
    std::string GetFileName(const std::string &filePath);

    bool IsDirectory(const std::string &path);
    bool IsRegularFile(const std::string &path);

    /// @brief 2つのパスが同じファイルを指すか
    bool IsSameFile(const std::string &path1, const std::string &path2);

    /// @brief ディレクトリ直下の通常ファイルのうち拡張子 extension (".txt" など) を持つものを名前順で返す
    std::vector<std::string> GetFilesWithExtension(const std::string &directoryPath, const std::string &extension);

    /// @brief 親ディレクトリを含めて作成する。失敗したら false
    bool CreateDirectories(const std::string &directoryPath);

    /// @brief filePath の親ディレクトリを作成する
    bool CreateParentDirectories(const std::string &filePath);

    /// @brief imagesDir 内で stem に対応する画像ファイルを探す。
    /// preferredExt を最初に試し、無ければ一般的な拡張子を順に試す。見つからなければ空文字
    std::string FindImageFile(const std::string &imagesDir, const std::string &stem, const std::string &preferredExt);

    /// @brief 画像を開いて幅と高さを取得する。読めなければ false
    bool ReadImageSize(const std::string &imagePath, int &width, int &height);
}
