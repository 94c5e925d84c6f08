/*
* @Author: StrayWarrior
* @Date:   2016-06-06
* @Last Modified by:   BlahGeek
* @Last Modified time: 2016-06-12
*/

#ifndef LENSWARP_PARALLEL_CALLER_H
#define LENSWARP_PARALLEL_CALLER_H value

#include <algorithm>
#include <opencv2/core/utility.hpp>

namespace lenswarp {

/**
 * Splits [start, end) into blocks of `block_size` elements and
 * hands each block, as a sub range, to the body
 */
template <typename Body>
class BlockLoopBody : public cv::ParallelLoopBody {
private:
    const Body & body;
    int block_size;
    cv::Range elem_range;
public:
    BlockLoopBody(const Body & body, int block_size, cv::Range elem_range):
        body(body), block_size(block_size), elem_range(elem_range) {}

    void operator() (const cv::Range & blocks) const override {
        int start = elem_range.start + blocks.start * block_size;
        int end = std::min(elem_range.start + blocks.end * block_size, elem_range.end);
        if(start < end)
            body(cv::Range(start, end));
    }
};

/**
 * Run body over range in parallel, body must only write to
 * the part of the output that belongs to the given sub range
 */
template <typename Body>
void parallel_for_caller(const cv::Range & range, const Body & body, int block_size=16) {
    if(range.end <= range.start)
        return;
    int n_blocks = (range.end - range.start + block_size - 1) / block_size;
    cv::parallel_for_(cv::Range(0, n_blocks), BlockLoopBody<Body>(body, block_size, range));
}

}

#endif /* LENSWARP_PARALLEL_CALLER_H */
