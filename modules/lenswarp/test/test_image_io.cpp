/*
* @Author: BlahGeek
* @Date:   2016-06-14
* @Last Modified by:   BlahGeek
* @Last Modified time: 2016-06-20
*/

#include <iostream>
#include <fstream>
#include <cstdio>
#include <gtest/gtest.h>
#include "./test_extra.hpp"

#include "lenswarp.hpp"

using namespace lenswarp;

namespace {

bool file_exists(const std::string & path) {
    std::ifstream f(path);
    return f.good();
}

TEST(ImageIOTest, output_path_test) {
    EXPECT_NO_THROW(check_output_path("out.jpg"));
    EXPECT_NO_THROW(check_output_path("out.JPEG"));
    EXPECT_NO_THROW(check_output_path("dir.name/out.Png"));
    EXPECT_CONFIG_ERROR(check_output_path("out.bmp"), "output");
    EXPECT_CONFIG_ERROR(check_output_path("out"), "output");
    EXPECT_CONFIG_ERROR(check_output_path("dir.png/out"), "output");
}

TEST(ImageIOTest, read_error_test) {
    std::string path = ::testing::TempDir() + "lenswarp_does_not_exist.png";
    try {
        read_image(path);
        ADD_FAILURE() << "no DecodeError";
    } catch(DecodeError & e) {
        EXPECT_EQ(e.filename(), path);
    }

    // not an image at all
    std::string text_path = ::testing::TempDir() + "lenswarp_not_an_image.jpg";
    {
        std::ofstream f(text_path);
        f << "hello" << std::endl;
    }
    EXPECT_THROW(read_image(text_path), DecodeError);
    std::remove(text_path.c_str());
}

TEST(ImageIOTest, write_read_test) {
    cv::Mat img(20, 30, CV_8UC4);
    cv::RNG rng(0x4242);
    rng.fill(img, cv::RNG::UNIFORM, 0, 256);

    std::string path = ::testing::TempDir() + "lenswarp_write_read.png";
    write_image(path, img);
    cv::Mat back = read_image(path);
    std::remove(path.c_str());

    // png is lossless, alpha is kept
    ASSERT_EQ(back.type(), CV_8UC4);
    ASSERT_EQ(back.size(), img.size());
    EXPECT_EQ(cv::norm(back, img, cv::NORM_INF), 0);
}

TEST(ImageIOTest, write_error_test) {
    cv::Mat img(20, 30, CV_8UC3, cv::Scalar::all(128));

    std::string path = ::testing::TempDir() + "lenswarp_no_such_dir/out.png";
    EXPECT_THROW(write_image(path, img), EncodeError);
    EXPECT_FALSE(file_exists(path));

    // encoding fails before the file is touched
    std::string empty_path = ::testing::TempDir() + "lenswarp_empty.jpg";
    EXPECT_THROW(write_image(empty_path, cv::Mat()), EncodeError);
    EXPECT_FALSE(file_exists(empty_path));

    EXPECT_CONFIG_ERROR(write_image(::testing::TempDir() + "lenswarp.tiff", img), "output");
}

}
