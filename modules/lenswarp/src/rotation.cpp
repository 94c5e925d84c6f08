/*
* @Author: BlahGeek
* @Date:   2016-06-04
* @Last Modified by:   BlahGeek
* @Last Modified time: 2016-06-16
*/

#if defined( _MSC_VER )
#define _USE_MATH_DEFINES
#endif
#include <cmath>
#include "lenswarp.hpp"
#include <opencv2/core.hpp>
#include <opencv2/calib3d.hpp>

using namespace lenswarp;

Rotation::Rotation(): rotate_matrix(cv::Matx33d::eye()) {}

Rotation::Rotation(double pitch, double yaw, double roll) {
    cv::Matx33d rotate_x, rotate_y, rotate_z;

    // yaw turns around the pole (z), roll around the depth axis (y)
    cv::Rodrigues(cv::Vec3d(pitch * M_PI / 180.0, 0, 0), rotate_x);
    cv::Rodrigues(cv::Vec3d(0, 0, yaw * M_PI / 180.0), rotate_z);
    cv::Rodrigues(cv::Vec3d(0, roll * M_PI / 180.0, 0), rotate_y);

    // pitch first, roll last
    this->rotate_matrix = rotate_y * rotate_z * rotate_x;
}

Rotation Rotation::then(const Rotation & next) const {
    Rotation ret;
    ret.rotate_matrix = next.rotate_matrix * this->rotate_matrix;
    return ret;
}

cv::Point3d Rotation::apply(const cv::Point3d & xyz) const {
    return rotate_matrix * xyz;
}

cv::Point3d Rotation::apply_inverse(const cv::Point3d & xyz) const {
    // orthonormal, inverse is the transpose
    return rotate_matrix.t() * xyz;
}

bool Rotation::is_identity() const {
    return cv::norm(rotate_matrix - cv::Matx33d::eye(), cv::NORM_INF) < 1e-12;
}
