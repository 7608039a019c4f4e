/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <ostream>
#include <string>

#include <fmt/format.h>

namespace busgen
{
    namespace generator
    {
        // Line oriented code emitter. A line starting with '}' is outdented before it is
        // written and a line ending with '{' indents the lines after it, comment lines never
        // change the indentation.
        class writer
        {
            std::ostream& strm_;
            int count_ = 0;

        public:
            explicit writer(std::ostream& strm, int count = 0)
                : strm_(strm)
                , count_(count)
            {
            }

            template<typename... Args> void operator()(const std::string& format_str, Args&&... args)
            {
                write_line(fmt::format(fmt::runtime(format_str), std::forward<Args>(args)...));
            }

            // writes text verbatim, braces are not format placeholders here
            void write_line(const std::string& line)
            {
                if (line.rfind("//", 0) == 0)
                {
                    print_tabs();
                    strm_ << line << '\n';
                    return;
                }
                if (!line.empty() && line.front() == '}')
                    count_--;
                if (line.empty())
                    strm_ << '\n';
                else
                {
                    print_tabs();
                    strm_ << line << '\n';
                }
                if (!line.empty() && line.back() == '{')
                    count_++;
            }

            template<typename... Args> void raw(const std::string& format_str, Args&&... args)
            {
                strm_ << fmt::format(fmt::runtime(format_str), std::forward<Args>(args)...);
            }

            void print_tabs()
            {
                for (int i = 0; i < count_; i++)
                    strm_ << "    ";
            }

            int get_count() const { return count_; }
            void set_count(int count) { count_ = count; }
        };
    }
}
