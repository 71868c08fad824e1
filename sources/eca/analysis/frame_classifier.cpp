//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/analysis/frame_classifier.hpp"
#include "eca/utils/string_utils.hpp"

#include <algorithm>

namespace eca::analysis {

    FrameClassifier::FrameClassifier(std::vector<std::string> framework_prefixes)
        : framework_prefixes_(std::move(framework_prefixes)) {}

    bool FrameClassifier::is_framework_frame(const std::string_view class_name) const {
        if (class_name.empty()) {
            return true;
        }
        return std::ranges::any_of(framework_prefixes_, [class_name](const std::string& prefix) {
            return string_utils::starts_with(class_name, prefix);
        });
    }

    std::vector<StackFrame> FrameClassifier::user_frames(const ParsedTrace& trace) const {
        std::vector<StackFrame> result;
        for (const auto& frame : trace.frames) {
            if (is_user_frame(frame)) {
                result.push_back(frame);
            }
        }
        return result;
    }

    std::vector<StackFrame> FrameClassifier::top_user_frames(const ParsedTrace& trace, const std::size_t n) const {
        std::vector<StackFrame> result;
        for (const auto& frame : trace.frames) {
            if (result.size() >= n) {
                break;
            }
            if (is_user_frame(frame)) {
                result.push_back(frame);
            }
        }
        return result;
    }

    const StackFrame* FrameClassifier::first_user_frame(const ParsedTrace& trace) const {
        const auto it = std::ranges::find_if(trace.frames, [this](const StackFrame& frame) {
            return is_user_frame(frame);
        });
        return it == trace.frames.end() ? nullptr : &*it;
    }

}  // namespace eca::analysis
