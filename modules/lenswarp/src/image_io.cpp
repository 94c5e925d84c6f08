/*
* @Author: BlahGeek
* @Date:   2016-06-14
* @Last Modified by:   BlahGeek
* @Last Modified time: 2016-06-20
*/

#include "lenswarp.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <vector>
#include "opencv2/imgcodecs.hpp"

using namespace lenswarp;

static std::string lower_extension(const std::string & path) {
    auto slash = path.find_last_of("/\\");
    auto dot = path.find_last_of('.');
    if(dot == std::string::npos || (slash != std::string::npos && dot < slash))
        return "";
    std::string ext = path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return char(std::tolower(c)); });
    return ext;
}

void lenswarp::check_output_path(const std::string & path) {
    std::string ext = lower_extension(path);
    if(ext != ".jpg" && ext != ".jpeg" && ext != ".png")
        throw ConfigurationError("output", "output file must end with .jpg, .jpeg or .png: " + path);
}

cv::Mat lenswarp::read_image(const std::string & path) {
    cv::Mat img;
    try {
        img = cv::imread(path, cv::IMREAD_UNCHANGED);
    } catch(cv::Exception & e) {
        throw DecodeError(path, e.what());
    }
    if(img.empty())
        throw DecodeError(path, "can not read or decode image");
    return img;
}

void lenswarp::write_image(const std::string & path, const cv::Mat & image) {
    check_output_path(path);

    std::vector<uchar> buf;
    bool encoded = false;
    try {
        encoded = cv::imencode(lower_extension(path), image, buf);
    } catch(cv::Exception & e) {
        throw EncodeError(path, e.what());
    }
    if(!encoded)
        throw EncodeError(path, "can not encode image");

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if(!f)
        throw EncodeError(path, "can not open file for writing");
    f.write(reinterpret_cast<const char *>(buf.data()), std::streamsize(buf.size()));
    f.close();
    if(!f) {
        std::remove(path.c_str());
        throw EncodeError(path, "can not write file");
    }
}
