/*
* @Author: BlahGeek
* @Date:   2016-06-09
* @Last Modified by:   BlahGeek
* @Last Modified time: 2016-06-20
*/

#include <iostream>
#include <sstream>
#include <gtest/gtest.h>
#include "./test_extra.hpp"

#include "lenswarp.hpp"

using namespace lenswarp;

namespace {

rapidjson::Document pano_options(int width, int height) {
    std::ostringstream ss;
    ss << "{\"width\": " << width << ", \"height\": " << height << "}";
    return json(ss.str().c_str());
}

rapidjson::Document photo_options(const char * lens, double fov, const char * layout,
                                  int width, int height) {
    std::ostringstream ss;
    ss << "{\"width\": " << width << ", \"height\": " << height
       << ", \"lens\": \"" << lens << "\", \"fov\": " << fov
       << ", \"layout\": \"" << layout << "\"}";
    return json(ss.str().c_str());
}

double max_diff(const cv::Mat & a, const cv::Mat & b, int row_begin, int row_end) {
    return cv::norm(a.rowRange(row_begin, row_end), b.rowRange(row_begin, row_end), cv::NORM_INF);
}

double mean_diff(const cv::Mat & a, const cv::Mat & b, int row_begin, int row_end) {
    double total = cv::norm(a.rowRange(row_begin, row_end), b.rowRange(row_begin, row_end), cv::NORM_L1);
    return total / (double(row_end - row_begin) * a.cols * a.channels());
}

class TemplateTest: public ::testing::Test {
public:
    cv::Size pano_size;
    cv::Mat pano;

    void SetUp() override {
        this->pano_size = cv::Size(128, 64);
        this->pano = smooth_panorama(pano_size);
    }
};

TEST_F(TemplateTest, identity_panorama_test) {
    auto opts = pano_options(128, 64);
    RemapTemplate remap_template("equirectangular", opts, "equirectangular", opts);
    EXPECT_EQ(remap_template.out_size, pano_size);
    EXPECT_EQ(remap_template.in_size, pano_size);
    EXPECT_TRUE(remap_template.wrap_input);
    EXPECT_DOUBLE_EQ(remap_template.coverage(), 1.0);

    cv::Mat out;
    remap_template.remap(pano, out);
    ASSERT_EQ(out.size(), pano_size);
    ASSERT_EQ(out.type(), pano.type());
    EXPECT_LT(max_diff(out, pano, 0, 64), 1e-3);
}

TEST_F(TemplateTest, identity_photo_test) {
    cv::Mat photo(101, 101, CV_8UC3);
    cv::RNG rng(0x1357);
    rng.fill(photo, cv::RNG::UNIFORM, 0, 256);

    auto opts = photo_options("equisolid", 180, "inscribed", 101, 101);
    RemapTemplate remap_template("fisheye", opts, "fisheye", opts, Rotation(0, 0, 0));
    EXPECT_FALSE(remap_template.wrap_input);
    EXPECT_NEAR(remap_template.coverage(), M_PI * 50.0 * 50.0 / (101.0 * 101.0), 0.01);

    cv::Mat out;
    remap_template.remap(photo, out);

    cv::Mat diff;
    cv::absdiff(out, photo, diff);
    diff.setTo(cv::Scalar::all(0), remap_template.mask == 0);
    EXPECT_LE(cv::norm(diff, cv::NORM_INF), 1.0);

    // outside of the circle is black
    EXPECT_EQ(out.at<cv::Vec3b>(0, 0), cv::Vec3b(0, 0, 0));
    EXPECT_EQ(out.at<cv::Vec3b>(100, 100), cv::Vec3b(0, 0, 0));
    EXPECT_EQ(remap_template.mask.at<unsigned char>(50, 50), 255);
}

TEST_F(TemplateTest, photo_round_trip_test) {
    auto pano_opts = pano_options(128, 64);
    auto photo_opts = photo_options("equidistant", 360, "inscribed", 256, 256);

    RemapTemplate make_photo("fisheye", photo_opts, "equirectangular", pano_opts);
    RemapTemplate make_pano("equirectangular", pano_opts, "fisheye", photo_opts);

    cv::Mat photo, back;
    make_photo.remap(pano, photo);
    EXPECT_EQ(photo.size(), cv::Size(256, 256));
    make_pano.remap(photo, back);
    EXPECT_DOUBLE_EQ(make_pano.coverage(), 1.0);

    // near the poles (top: photo center, bottom: photo edge) the
    // round trip is degenerate
    EXPECT_LT(max_diff(back, pano, 4, 48), 3.0);
    EXPECT_LT(mean_diff(back, pano, 4, 48), 0.5);
}

TEST_F(TemplateTest, fov_reduction_test) {
    // front hemisphere (top half) is 100, back hemisphere is 200
    cv::Mat halves(pano_size, CV_8UC1, cv::Scalar(100));
    halves.rowRange(32, 64).setTo(cv::Scalar(200));

    auto pano_opts = pano_options(128, 64);
    auto photo_opts = photo_options("equidistant", 180, "inscribed", 128, 128);

    RemapTemplate make_photo("fisheye", photo_opts, "equirectangular", pano_opts);
    RemapTemplate make_pano("equirectangular", pano_opts, "fisheye", photo_opts);
    EXPECT_DOUBLE_EQ(make_pano.coverage(), 0.5);

    cv::Mat photo, back;
    make_photo.remap(halves, photo);
    make_pano.remap(photo, back);

    // nothing of the back hemisphere comes back
    EXPECT_EQ(cv::countNonZero(back.rowRange(32, 64)), 0);
    double max_value = 0;
    cv::minMaxLoc(back, NULL, &max_value);
    EXPECT_LT(max_value, 200);
    EXPECT_EQ(max_diff(back, halves, 0, 28), 0);
}

TEST_F(TemplateTest, double_round_trip_test) {
    auto pano_opts = pano_options(128, 64);
    auto double_opts = photo_options("equidistant", 195, "double", 256, 128);

    RemapTemplate make_photo("fisheye", double_opts, "equirectangular", pano_opts);
    RemapTemplate make_pano("equirectangular", pano_opts, "fisheye", double_opts);
    EXPECT_EQ(make_photo.out_size, cv::Size(256, 128));

    cv::Mat photo, back;
    make_photo.remap(pano, photo);
    make_pano.remap(photo, back);
    EXPECT_DOUBLE_EQ(make_pano.coverage(), 1.0);
    EXPECT_LT(max_diff(back, pano, 4, 60), 3.0);

    // each half is an ordinary inscribed photo, the right one facing backwards
    auto half_opts = photo_options("equidistant", 195, "inscribed", 128, 128);
    RemapTemplate from_left("equirectangular", pano_opts, "fisheye", half_opts);
    RemapTemplate from_right("equirectangular", pano_opts, "fisheye", half_opts,
                             Rotation(0, 0, 180));

    cv::Mat left = photo(cv::Rect(0, 0, 128, 128)).clone();
    cv::Mat right = photo(cv::Rect(128, 0, 128, 128)).clone();
    cv::Mat back_left, back_right;
    from_left.remap(left, back_left);
    from_right.remap(right, back_right);

    EXPECT_LT(max_diff(back_left, pano, 4, 29), 3.0);
    EXPECT_LT(max_diff(back_right, pano, 36, 60), 3.0);
}

TEST_F(TemplateTest, aspect_ratio_test) {
    // inscribed -> double keeps the height, and doubles the width
    EXPECT_DOUBLE_EQ(camera_aspect_ratio("fisheye", json("{\"layout\": \"inscribed\"}")), 1.0);
    EXPECT_DOUBLE_EQ(camera_aspect_ratio("fisheye", json("{}")), 1.0);
    EXPECT_DOUBLE_EQ(camera_aspect_ratio("fisheye", json("{\"layout\": \"double\"}")), 2.0);
    EXPECT_DOUBLE_EQ(camera_aspect_ratio("equirectangular", json("{}")), 2.0);
    EXPECT_TRUE(std::isnan(camera_aspect_ratio("fisheye", json("{\"layout\": \"full\"}"))));
    EXPECT_TRUE(std::isnan(camera_aspect_ratio("fisheye", json("{\"layout\": \"cropped\"}"))));
    EXPECT_CONFIG_ERROR(camera_aspect_ratio("pinhole", json("{}")), "type");
    EXPECT_CONFIG_ERROR(camera_aspect_ratio("fisheye", json("{\"layout\": \"oval\"}")), "layout");
}

TEST_F(TemplateTest, seam_test) {
    cv::Mat img(pano_size, CV_8UC3);
    cv::RNG rng(0x2468);
    rng.fill(img, cv::RNG::UNIFORM, 0, 256);

    // yaw turns around the pole and shifts longitude by a quarter turn,
    // the first quarter of the output comes from across the seam
    auto opts = pano_options(128, 64);
    RemapTemplate remap_template("equirectangular", opts, "equirectangular", opts,
                                 Rotation(0, 90, 0));
    cv::Mat out;
    remap_template.remap(img, out);

    for(int x = 0 ; x < 128 ; x += 1) {
        int src = (x + 96) % 128;
        EXPECT_EQ(cv::norm(out.col(x), img.col(src), cv::NORM_INF), 0) << "column " << x;
    }

    // looking right at the lon = PI meridian
    cv::Mat gray(pano_size, CV_8UC1, cv::Scalar(200));
    auto photo_opts = photo_options("rectilinear", 90, "full", 64, 64);
    RemapTemplate look_back("fisheye", photo_opts, "equirectangular", opts, Rotation(0, 0, 90));
    EXPECT_DOUBLE_EQ(look_back.coverage(), 1.0);
    cv::Mat photo;
    look_back.remap(gray, photo);
    EXPECT_EQ(cv::countNonZero(photo != 200), 0);
}

TEST_F(TemplateTest, supersample_test) {
    cv::Mat color(pano_size, CV_8UC4, cv::Scalar(10, 20, 30, 40));
    auto pano_opts = pano_options(128, 64);
    auto photo_opts = photo_options("equidistant", 180, "inscribed", 64, 64);

    RemapTemplate remap_template("fisheye", photo_opts, "equirectangular", pano_opts,
                                 Rotation(), 2);
    EXPECT_EQ(remap_template.out_size, cv::Size(64, 64));
    EXPECT_EQ(remap_template.map_size, cv::Size(128, 128));
    EXPECT_EQ(remap_template.map1.size(), cv::Size(128, 128));

    cv::Mat photo;
    remap_template.remap(color, photo);
    ASSERT_EQ(photo.size(), cv::Size(64, 64));
    ASSERT_EQ(photo.type(), CV_8UC4);
    // channels (alpha included) go through untouched, misses are zero in all of them
    EXPECT_EQ(photo.at<cv::Vec4b>(32, 32), cv::Vec4b(10, 20, 30, 40));
    EXPECT_EQ(photo.at<cv::Vec4b>(0, 0), cv::Vec4b(0, 0, 0, 0));

    // close to the plain result on smooth content
    RemapTemplate plain("fisheye", photo_opts, "equirectangular", pano_opts);
    cv::Mat smooth_super, smooth_plain;
    remap_template.remap(pano, smooth_super);
    plain.remap(pano, smooth_plain);
    EXPECT_LT(max_diff(smooth_super(cv::Rect(16, 16, 32, 32)),
                       smooth_plain(cv::Rect(16, 16, 32, 32)), 0, 32), 3.0);
}

TEST_F(TemplateTest, error_test) {
    auto pano_opts = pano_options(128, 64);
    auto bad_fov = photo_options("rectilinear", 200, "inscribed", 64, 64);
    auto bad_layout = photo_options("equidistant", 180, "double", 63, 64);

    EXPECT_CONFIG_ERROR(RemapTemplate t("fisheye", bad_fov, "equirectangular", pano_opts), "output.fov");
    EXPECT_CONFIG_ERROR(RemapTemplate t("equirectangular", pano_opts, "fisheye", bad_fov), "input.fov");
    EXPECT_CONFIG_ERROR(RemapTemplate t("fisheye", bad_layout, "equirectangular", pano_opts), "output.width");
    EXPECT_CONFIG_ERROR(RemapTemplate t("cubemap", pano_opts, "equirectangular", pano_opts), "output.type");
    EXPECT_CONFIG_ERROR(RemapTemplate t("equirectangular", pano_opts, "equirectangular",
                                        json("[128, 64]")), "input.options");
    EXPECT_CONFIG_ERROR(RemapTemplate t("equirectangular", pano_opts, "equirectangular", pano_opts,
                                        Rotation(), 0), "supersample");
    // maps of 128 * 2^24 columns do not fit in an int
    EXPECT_CONFIG_ERROR(RemapTemplate t("equirectangular", pano_opts, "equirectangular", pano_opts,
                                        Rotation(), 1 << 24), "supersample");

    RemapTemplate remap_template("equirectangular", pano_opts, "equirectangular", pano_opts);
    cv::Mat small(32, 64, CV_8UC3, cv::Scalar::all(1)), out;
    EXPECT_CONFIG_ERROR(remap_template.remap(small, out), "input.size");
    EXPECT_TRUE(out.empty());
}

}
