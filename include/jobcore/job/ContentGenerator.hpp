#pragma once

#include <optional>
#include <string>

namespace jobcore::job {

    /**
     * @brief Lazy, single pass sequence of content lines, independent of a job's live cursor.
     */
    class ContentGenerator {
    public:
        virtual ~ContentGenerator() = default;

        virtual std::optional<std::string> next() = 0;
    };

}
