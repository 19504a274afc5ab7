/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include <gtest/gtest.h>
#include <pugixml.hpp>

#include "Errors.hpp"
#include "TestUtil.hpp"
#include "formats/VocReader.hpp"
#include "formats/VocWriter.hpp"

static std::string makeVocXml(const std::string &fileName, const std::string &objects)
{
    return "<annotation>\n"
           "  <folder>images</folder>\n"
           "  <filename>" +
           fileName +
           "</filename>\n"
           "  <size><width>640</width><height>480</height><depth>3</depth></size>\n" +
           objects + "</annotation>\n";
}

static std::string makeObject(const std::string &name, const std::string &box, const std::string &extra = "")
{
    return "  <object><name>" + name + "</name>" + extra + "<bndbox>" + box + "</bndbox></object>\n";
}

static const char *kBox = "<xmin>10</xmin><ymin>20</ymin><xmax>110</xmax><ymax>220</ymax>";

// ─────────────────────────────────────────────────────────────────────────────
// Reader
// ─────────────────────────────────────────────────────────────────────────────

TEST(VocFormatTest, ReadsObjectsAndFlags)
{
    TempDir tmp;
    WriteTextFile(tmp.Path("ann/a.xml"),
                  makeVocXml("a.jpg", makeObject("dog", kBox, "<difficult>1</difficult><truncated>0</truncated>") +
                                          makeObject("cat", kBox, "<truncated>1</truncated>")));

    VocReader reader;
    const Dataset dataset = reader.Read(tmp.Path("ann"));

    ASSERT_EQ(dataset.GetImages().size(), 1u);
    const Image &image = dataset.GetImages()[0];
    EXPECT_EQ(image.fileName, "a.jpg");
    EXPECT_EQ(image.width, 640);
    EXPECT_EQ(image.height, 480);

    ASSERT_EQ(image.annotations.size(), 2u);
    EXPECT_DOUBLE_EQ(image.annotations[0].bbox.x0, 10.0);
    EXPECT_DOUBLE_EQ(image.annotations[0].bbox.y1, 220.0);
    EXPECT_TRUE(image.annotations[0].difficult);
    EXPECT_FALSE(image.annotations[0].truncated);
    EXPECT_FALSE(image.annotations[1].difficult);
    EXPECT_TRUE(image.annotations[1].truncated);
}

TEST(VocFormatTest, MissingFlagsDefaultToFalse)
{
    TempDir tmp;
    WriteTextFile(tmp.Path("ann/a.xml"), makeVocXml("a.jpg", makeObject("dog", kBox)));

    VocReader reader;
    const Dataset dataset = reader.Read(tmp.Path("ann"));
    const Annotation &annotation = dataset.GetImages()[0].annotations[0];
    EXPECT_FALSE(annotation.difficult);
    EXPECT_FALSE(annotation.truncated);
}

TEST(VocFormatTest, CategoryIdsFollowFirstAppearance)
{
    TempDir tmp;
    WriteTextFile(tmp.Path("ann/a.xml"), makeVocXml("a.jpg", makeObject("zebra", kBox) + makeObject("ant", kBox)));
    WriteTextFile(tmp.Path("ann/b.xml"), makeVocXml("b.jpg", makeObject("ant", kBox) + makeObject("bee", kBox)));

    VocReader reader;
    const Dataset dataset = reader.Read(tmp.Path("ann"));

    ASSERT_EQ(dataset.GetCategories().size(), 3u);
    EXPECT_EQ(dataset.GetCategoryByName("zebra").id, 0);
    EXPECT_EQ(dataset.GetCategoryByName("ant").id, 1);
    EXPECT_EQ(dataset.GetCategoryByName("bee").id, 2);
    EXPECT_EQ(dataset.GetImages()[1].annotations[0].categoryId, 1);
}

TEST(VocFormatTest, FractionalSizeIsRounded)
{
    TempDir tmp;
    WriteTextFile(tmp.Path("ann/a.xml"), "<annotation><filename>a.jpg</filename>"
                                         "<size><width>640.0</width><height>479.6</height></size></annotation>");

    VocReader reader;
    const Dataset dataset = reader.Read(tmp.Path("ann"));
    const Image &image = dataset.GetImages()[0];
    EXPECT_EQ(image.width, 640);
    EXPECT_EQ(image.height, 480);
    EXPECT_TRUE(image.annotations.empty());
}

TEST(VocFormatTest, MalformedXmlIsFormatError)
{
    TempDir tmp;
    WriteTextFile(tmp.Path("ann/a.xml"), "<annotation><filename>a.jpg</filename>");

    VocReader reader;
    EXPECT_THROW(reader.Read(tmp.Path("ann")), FormatError);
}

TEST(VocFormatTest, MissingRequiredElementIsFormatError)
{
    VocReader reader;
    {
        TempDir tmp;
        WriteTextFile(tmp.Path("ann/a.xml"), makeVocXml("a.jpg", "  <object><name>dog</name></object>\n"));
        EXPECT_THROW(reader.Read(tmp.Path("ann")), FormatError);
    }
    {
        TempDir tmp;
        WriteTextFile(tmp.Path("ann/a.xml"),
                      makeVocXml("a.jpg", makeObject("dog", "<xmin>10</xmin><ymin>20</ymin><xmax>110</xmax>")));
        EXPECT_THROW(reader.Read(tmp.Path("ann")), FormatError);
    }
    {
        TempDir tmp;
        WriteTextFile(tmp.Path("ann/a.xml"), "<annotation><filename>a.jpg</filename></annotation>");
        EXPECT_THROW(reader.Read(tmp.Path("ann")), FormatError);
    }
    {
        TempDir tmp;
        WriteTextFile(tmp.Path("ann/a.xml"),
                      makeVocXml("a.jpg", makeObject("dog", "<xmin>ten</xmin><ymin>20</ymin><xmax>110</xmax><ymax>220</ymax>")));
        EXPECT_THROW(reader.Read(tmp.Path("ann")), FormatError);
    }
}

TEST(VocFormatTest, MissingDirectoryIsMissingResourceError)
{
    TempDir tmp;
    VocReader reader;
    EXPECT_THROW(reader.Read(tmp.Path("nothing")), MissingResourceError);
}

// ─────────────────────────────────────────────────────────────────────────────
// Writer
// ─────────────────────────────────────────────────────────────────────────────

TEST(VocFormatTest, WriterRoundsToPixelsAndKeepsFlags)
{
    TempDir tmp;
    Dataset dataset;
    dataset.AddCategory(Category(0, "dog"));
    Image image("photos/a.jpg", 640, 480);
    image.AddAnnotation(Annotation(BboxXyxy(10.4, 20.6, 109.5, 220.2), 0, "dog", true, false));
    dataset.AddImage(image);

    VocWriter writer;
    writer.SetFolder("JPEGImages");
    writer.Write(dataset, tmp.Path("out"));

    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_file(tmp.Path("out/a.xml").c_str()));
    const pugi::xml_node root = doc.child("annotation");
    EXPECT_STREQ(root.child("folder").text().get(), "JPEGImages");
    EXPECT_STREQ(root.child("filename").text().get(), "photos/a.jpg");
    EXPECT_EQ(root.child("size").child("width").text().as_int(), 640);
    EXPECT_EQ(root.child("size").child("depth").text().as_int(), 3);

    const pugi::xml_node object = root.child("object");
    EXPECT_STREQ(object.child("name").text().get(), "dog");
    EXPECT_EQ(object.child("difficult").text().as_int(), 1);
    EXPECT_EQ(object.child("truncated").text().as_int(), 0);

    const pugi::xml_node bndbox = object.child("bndbox");
    EXPECT_STREQ(bndbox.child("xmin").text().get(), "10");
    EXPECT_STREQ(bndbox.child("ymin").text().get(), "21");
    EXPECT_STREQ(bndbox.child("xmax").text().get(), "110");
    EXPECT_STREQ(bndbox.child("ymax").text().get(), "220");
}

TEST(VocFormatTest, SameStemIsReported)
{
    TempDir tmp;
    Dataset dataset;
    dataset.AddCategory(Category(0, "dog"));
    Image jpg("a.jpg", 640, 480);
    jpg.AddAnnotation(Annotation(BboxXyxy(1, 2, 3, 4), 0, "dog"));
    dataset.AddImage(jpg);
    dataset.AddImage(Image("a.png", 32, 32));

    VocWriter writer;
    testing::internal::CaptureStdout();
    writer.Write(dataset, tmp.Path("out"));
    const std::string log = testing::internal::GetCapturedStdout();

    EXPECT_NE(log.find("Warning: a.png overwrites"), std::string::npos);

    VocReader reader;
    const Dataset back = reader.Read(tmp.Path("out"));
    ASSERT_EQ(back.GetImages().size(), 1u);
    EXPECT_EQ(back.GetImages()[0].fileName, "a.png");
}

TEST(VocFormatTest, WrittenFilesReadBack)
{
    TempDir tmp;
    Dataset dataset;
    dataset.AddCategory(Category(0, "dog"));
    dataset.AddCategory(Category(1, "cat"));
    Image a("a.jpg", 640, 480);
    a.AddAnnotation(Annotation(BboxXyxy(10, 20, 110, 220), 1, "cat", false, true));
    a.AddAnnotation(Annotation(BboxXyxy(1, 2, 3, 4), 0, "dog"));
    dataset.AddImage(a);
    dataset.AddImage(Image("b.jpg", 32, 32));

    VocWriter writer;
    writer.Write(dataset, tmp.Path("out"));

    VocReader reader;
    const Dataset back = reader.Read(tmp.Path("out"));
    ASSERT_EQ(back.GetImages().size(), 2u);
    ASSERT_EQ(back.GetImages()[0].annotations.size(), 2u);
    EXPECT_EQ(back.GetImages()[0].annotations[0].categoryName, "cat");
    EXPECT_TRUE(back.GetImages()[0].annotations[0].truncated);
    EXPECT_FALSE(back.GetImages()[0].annotations[0].difficult);
    EXPECT_DOUBLE_EQ(back.GetImages()[0].annotations[1].bbox.x1, 3.0);
    EXPECT_TRUE(back.GetImages()[1].annotations.empty());
    EXPECT_EQ(back.GetImages()[1].width, 32);
}
