/*
* @Author: BlahGeek
* @Date:   2016-06-03
* @Last Modified by:   BlahGeek
* @Last Modified time: 2016-06-18
*/

#include <cmath>
#include <algorithm>
#include <sstream>

#include "./layout.hpp"
#include "lenswarp.hpp"

using namespace lenswarp;

Layout::Layout(LayoutType type, cv::Size size):
type(type), size(size), radius(0) {
    if(size.width < 2)
        throw ConfigurationError("width", "image width must be at least 2 pixels");
    if(size.height < 2)
        throw ConfigurationError("height", "image height must be at least 2 pixels");

    this->circle_size = size;
    if(type == LayoutType::double_inscribed) {
        if(size.width % 2 != 0) {
            std::ostringstream msg;
            msg << "a double image needs an even width, got " << size.width;
            throw ConfigurationError("width", msg.str());
        }
        this->circle_size.width = size.width / 2;
        if(this->circle_size.width < 2)
            throw ConfigurationError("width", "a double image needs at least 2 pixels per circle");
    }

    this->center = cv::Point2d((circle_size.width - 1) / 2.0,
                               (circle_size.height - 1) / 2.0);

    switch(type) {
        case LayoutType::inscribed:
        case LayoutType::double_inscribed:
            this->radius = std::min(circle_size.width, circle_size.height) / 2.0 - 0.5;
            break;
        case LayoutType::full:
            this->radius = std::sqrt(center.x * center.x + center.y * center.y);
            break;
        case LayoutType::cropped:
            this->radius = circle_size.width / 2.0 - 0.5;
            break;
    }
}

int Layout::pixel_to_circle(const cv::Point2d & xy, cv::Point2d & uv) const {
    int index = 0;
    double x = xy.x;
    if(type == LayoutType::double_inscribed && x >= circle_size.width - 0.5) {
        index = 1;
        x -= circle_size.width;
    }
    uv.x = (x - center.x) / radius;
    uv.y = (center.y - xy.y) / radius;
    return index;
}

cv::Point2d Layout::circle_to_pixel(int index, const cv::Point2d & uv) const {
    CV_Assert(index >= 0 && index < this->get_circles());

    double x = center.x + uv.x * radius;
    double y = center.y - uv.y * radius;

    // out of the sensor, e.g. above a cropped circle
    if(!(x >= -0.5 && x <= circle_size.width - 0.5 &&
         y >= -0.5 && y <= circle_size.height - 0.5))
        return cv::Point2d(NAN, NAN);

    x = std::max(0.0, std::min(x, circle_size.width - 1.0));
    y = std::max(0.0, std::min(y, circle_size.height - 1.0));

    return cv::Point2d(x + index * circle_size.width, y);
}

LayoutType Layout::parse_type(const std::string & name) {
    if(name == "inscribed") return LayoutType::inscribed;
    if(name == "full") return LayoutType::full;
    if(name == "cropped") return LayoutType::cropped;
    if(name == "double") return LayoutType::double_inscribed;
    throw ConfigurationError("layout", "unknown image type \"" + name + "\"");
}

const char * Layout::type_name(LayoutType type) {
    switch(type) {
        case LayoutType::inscribed: return "inscribed";
        case LayoutType::full: return "full";
        case LayoutType::cropped: return "cropped";
        case LayoutType::double_inscribed: return "double";
    }
    return "unknown";
}
