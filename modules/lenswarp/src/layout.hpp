/*
* @Author: BlahGeek
* @Date:   2016-06-03
* @Last Modified by:   BlahGeek
* @Last Modified time: 2016-06-18
*/

#ifndef LENSWARP_LAYOUT_H_
#define LENSWARP_LAYOUT_H_ value

#include <string>
#include "opencv2/core.hpp"

namespace lenswarp {

enum class LayoutType {
    inscribed,         // one circle inscribed in the image
    full,              // image inscribed in the circle, corners on the circle
    cropped,           // circle spans the width, cut at top and bottom
    double_inscribed,  // two inscribed circles side by side
};

/**
 * Where the lens circle(s) sit in a photo
 * Circle coordinates (u, v): u to the right, v up, unit circle is the FoV edge.
 * The edge passes through the centers of the outermost pixels.
 */
class Layout {
private:
    LayoutType type;
    cv::Size size;
    cv::Size circle_size;  // sub-image holding one circle
    cv::Point2d center;    // relative to the sub-image
    double radius;         // in pixels

public:
    Layout(LayoutType type, cv::Size size);

    int get_circles() const {
        return type == LayoutType::double_inscribed ? 2 : 1;
    }
    double get_radius() const { return radius; }
    LayoutType get_type() const { return type; }
    cv::Size get_circle_size() const { return circle_size; }

    /**
     * @param  xy pixel coordinate
     * @param  uv output, circle coordinate (may lie outside the unit disk)
     * @return    circle index, 0 for left and 1 for right
     */
    int pixel_to_circle(const cv::Point2d & xy, cv::Point2d & uv) const;

    /**
     * @param  index circle index
     * @param  uv    circle coordinate
     * @return       pixel coordinate, clamped to the circle's sub-image when
     *               less than half a pixel outside, NAN when further
     */
    cv::Point2d circle_to_pixel(int index, const cv::Point2d & uv) const;

public:
    // throws ConfigurationError("layout")
    static LayoutType parse_type(const std::string & name);
    static const char * type_name(LayoutType type);
};

}

#endif
