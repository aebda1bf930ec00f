#pragma once

#include "types.hpp"
#include "item.hpp"
#include <ostream>
#include <string>

namespace todo
{

    class ItemRenderer
    {
    public:
        /** Confirmation block: intro line, blank line, then the item as indented JSON */
        static std::string format(const ParsedItem &item);

        /**
         * Write format(item) to `out` and flush. Returns the number of
         * characters written, or an IOError if the stream is unusable.
         */
        static Result<std::size_t> render(const ParsedItem &item, std::ostream &out);
    };

} // namespace todo
