//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_FRAME_CLASSIFIER_HPP
#define ERRORCLUSTERANALYZER_FRAME_CLASSIFIER_HPP

/**
 * @file frame_classifier.hpp
 * @brief Separates application frames from framework and JDK frames.
 */

#include "eca/types.hpp"
#include "eca/heuristics/config.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace eca::analysis {

    /**
     * Classifies frames by class name prefix.
     *
     * A frame is a framework frame when its class name starts with one of
     * the configured prefixes. A frame without a class name is treated as
     * framework code; it carries nothing to group on.
     */
    class FrameClassifier {
    public:
        explicit FrameClassifier(
            std::vector<std::string> framework_prefixes = heuristics::default_framework_prefixes()
        );

        [[nodiscard]] bool is_framework_frame(std::string_view class_name) const;

        [[nodiscard]] bool is_user_frame(const StackFrame& frame) const {
            return !is_framework_frame(frame.class_name);
        }

        /**
         * User frames of the outermost trace, in stack order.
         */
        [[nodiscard]] std::vector<StackFrame> user_frames(const ParsedTrace& trace) const;

        /**
         * At most n leading user frames of the outermost trace.
         */
        [[nodiscard]] std::vector<StackFrame> top_user_frames(const ParsedTrace& trace, std::size_t n) const;

        /**
         * The topmost user frame, or nullptr when every frame is framework code.
         */
        [[nodiscard]] const StackFrame* first_user_frame(const ParsedTrace& trace) const;

        [[nodiscard]] bool has_user_frames(const ParsedTrace& trace) const {
            return first_user_frame(trace) != nullptr;
        }

        [[nodiscard]] const std::vector<std::string>& framework_prefixes() const noexcept {
            return framework_prefixes_;
        }

    private:
        std::vector<std::string> framework_prefixes_;
    };

}  // namespace eca::analysis

#endif //ERRORCLUSTERANALYZER_FRAME_CLASSIFIER_HPP
