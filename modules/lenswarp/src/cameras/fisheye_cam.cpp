/*
* @Author: BlahGeek
* @Date:   2016-06-05
* @Last Modified by:   BlahGeek
* @Last Modified time: 2016-06-18
*/

#include "./fisheye_cam.hpp"
#include <iostream>

using namespace lenswarp;

FisheyeCamera::FisheyeCamera(const rapidjson::Value & options):
Camera(options),
lens(Lens::parse_type(get_string_option(options, "lens")),
     get_double_option(options, "fov")),
layout(Layout::parse_type(get_string_option(options, "layout", "inscribed")),
       this->size) {

    if(layout.get_type() == LayoutType::double_inscribed && lens.get_fov() < 180)
        throw ConfigurationError("fov", "the FoV of a double image is per circle and "
                                        "can not be smaller than 180 degrees");

    std::cerr << "Fisheye camera: " << Lens::type_name(lens.get_type())
              << ", fov = " << lens.get_fov()
              << ", " << Layout::type_name(layout.get_type())
              << " " << size << ", radius = " << layout.get_radius() << std::endl;
}

cv::Point3d FisheyeCamera::image_to_obj_single(const cv::Point2d & xy) const {
    cv::Point2d uv;
    int index = layout.pixel_to_circle(xy, uv);

    double theta = lens.radius_to_angle(sqrt(uv.x * uv.x + uv.y * uv.y));
    if(std::isnan(theta))
        return cv::Point3d(NAN, NAN, NAN);

    // the back circle is seen from behind
    if(index == 1)
        uv.x = - uv.x;
    double phi = atan2(uv.y, uv.x);

    cv::Point3d ret(sin(theta) * cos(phi),
                    sin(theta) * sin(phi),
                    cos(theta));
    if(index == 1)
        ret.z = - ret.z;
    return ret;
}

cv::Point2d FisheyeCamera::obj_to_image_single(const cv::Point3d & xyz) const {
    // nearest circle
    int index = 0;
    if(layout.get_circles() == 2 && xyz.z < 0)
        index = 1;

    double axial = (index == 0) ? xyz.z : - xyz.z;
    double radial = sqrt(xyz.x * xyz.x + xyz.y * xyz.y);
    if(std::isnan(axial) || std::isnan(radial) || (axial == 0 && radial == 0))
        return cv::Point2d(NAN, NAN);

    double r = lens.angle_to_radius(atan2(radial, axial));
    if(std::isnan(r))
        return cv::Point2d(NAN, NAN);

    double phi = atan2(xyz.y, xyz.x);
    cv::Point2d uv(r * cos(phi), r * sin(phi));
    if(index == 1)
        uv.x = - uv.x;

    return layout.circle_to_pixel(index, uv);
}
