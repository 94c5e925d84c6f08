/*
* @Author: BlahGeek
* @Date:   2016-06-06
* @Last Modified by:   BlahGeek
* @Last Modified time: 2016-06-06
*/

#include <iostream>
#include "lenswarp.hpp"
#include "opencv2/core/utility.hpp"


using namespace lenswarp;

Timer::Timer(std::string name): t(cv::getTickCount()), name(name) {}

Timer::Timer(): Timer("") {}

double Timer::tick(std::string msg) {
    int64_t tn = cv::getTickCount();
    double time_elapsed = (tn - t) * 1000.0 / cv::getTickFrequency();

    std::cerr << "[ Timer " << name << "] " << msg << ": " << time_elapsed << "ms" << std::endl;

    t = tn;
    return time_elapsed;
}
