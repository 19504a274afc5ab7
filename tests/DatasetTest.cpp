/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include <gtest/gtest.h>

#include "Errors.hpp"
#include "dataset/Dataset.hpp"

TEST(DatasetTest, AddCategoryRejectsDuplicateId)
{
    Dataset dataset;
    dataset.AddCategory(Category(1, "car"));
    EXPECT_THROW(dataset.AddCategory(Category(1, "truck")), DuplicateCategoryError);
    EXPECT_EQ(dataset.GetCategories().size(), 1u);
}

TEST(DatasetTest, DuplicateNameIsAllowed)
{
    Dataset dataset;
    dataset.AddCategory(Category(1, "car"));
    EXPECT_NO_THROW(dataset.AddCategory(Category(2, "car")));
    EXPECT_EQ(dataset.GetCategoryByName("car").id, 1);
}

TEST(DatasetTest, LookupCategory)
{
    Dataset dataset;
    dataset.AddCategory(Category(5, "person"));
    dataset.AddCategory(Category(2, "dog"));

    EXPECT_EQ(dataset.GetCategoryById(2).name, "dog");
    EXPECT_EQ(dataset.GetCategoryByName("person").id, 5);
    EXPECT_TRUE(dataset.HasCategory(5));
    EXPECT_FALSE(dataset.HasCategory(3));
    EXPECT_THROW(dataset.GetCategoryById(3), CategoryNotFoundError);
    EXPECT_THROW(dataset.GetCategoryByName("cat"), CategoryNotFoundError);
}

TEST(DatasetTest, CategoriesKeepInsertionOrder)
{
    Dataset dataset;
    dataset.AddCategory(Category(9, "z"));
    dataset.AddCategory(Category(1, "a"));

    ASSERT_EQ(dataset.GetCategories().size(), 2u);
    EXPECT_EQ(dataset.GetCategories()[0].id, 9);
    EXPECT_EQ(dataset.GetCategories()[1].id, 1);
}

TEST(DatasetTest, AddImageAppendsWithoutNameCheck)
{
    Dataset dataset;
    dataset.AddImage(Image("a.jpg", 10, 10));
    dataset.AddImage(Image("a.jpg", 20, 20));

    ASSERT_EQ(dataset.GetImages().size(), 2u);
    EXPECT_EQ(dataset.GetImages()[1].width, 20);
}

TEST(DatasetTest, AnnotationsAreOrderedAndCounted)
{
    Dataset dataset;
    dataset.AddCategory(Category(0, "car"));

    Image image("a.jpg", 100, 100);
    image.AddAnnotation(Annotation(BboxXyxy(0, 0, 10, 10), 0, "car"));
    image.AddAnnotation(Annotation(BboxXyxy(5, 5, 20, 20), 0, "car"));
    dataset.AddImage(image);
    dataset.AddImage(Image("b.jpg", 100, 100));

    EXPECT_EQ(dataset.NumAnnotations(), 2u);
    EXPECT_DOUBLE_EQ(dataset.GetImages()[0].annotations[1].bbox.x0, 5.0);
}

TEST(DatasetTest, OptionalFieldDefaults)
{
    const Annotation annotation(BboxXyxy(0, 0, 10, 20), 0, "car");
    EXPECT_FALSE(annotation.difficult);
    EXPECT_FALSE(annotation.truncated);
    EXPECT_EQ(annotation.iscrowd, 0);
    EXPECT_DOUBLE_EQ(annotation.GetArea(), 200.0);

    const Image image("a.jpg", 0, 480);
    EXPECT_FALSE(image.IsSizeKnown());
}
