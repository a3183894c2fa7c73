#include <relay/types.hpp>

namespace relay {

const char* model_size_name(ModelSize size) {
    switch (size) {
        case ModelSize::SMALL: return "small";
        case ModelSize::MEDIUM: return "medium";
        case ModelSize::LARGE: return "large";
    }
    return "medium";
}

const char* priority_name(Priority priority) {
    switch (priority) {
        case Priority::LOW: return "low";
        case Priority::NORMAL: return "normal";
        case Priority::HIGH: return "high";
        case Priority::CRITICAL: return "critical";
    }
    return "normal";
}

}  // namespace relay
