/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "Dataset.hpp"
#include "Errors.hpp"

void Dataset::AddCategory(const Category &category)
{
    if (HasCategory(category.id))
    {
        throw DuplicateCategoryError("id " + std::to_string(category.id) + " (" + category.name + ")");
    }
    categories.push_back(category);
}

void Dataset::AddImage(const Image &image) { images.push_back(image); }

bool Dataset::HasCategory(const int id) const
{
    for (const Category &category : categories)
    {
        if (category.id == id) return true;
    }
    return false;
}

const Category &Dataset::GetCategoryById(const int id) const
{
    for (const Category &category : categories)
    {
        if (category.id == id) return category;
    }
    throw CategoryNotFoundError("id " + std::to_string(id));
}

const Category &Dataset::GetCategoryByName(const std::string &name) const
{
    for (const Category &category : categories)
    {
        if (category.name == name) return category;
    }
    throw CategoryNotFoundError("name \"" + name + "\"");
}

size_t Dataset::NumAnnotations() const
{
    size_t count = 0;
    for (const Image &image : images)
    {
        count += image.annotations.size();
    }
    return count;
}
