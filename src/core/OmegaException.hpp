//
// Created on 02/10/2025.
//

#ifndef DADDECK_OMEGAEXCEPTION_HPP
#define DADDECK_OMEGAEXCEPTION_HPP

#include <source_location>
#include <string>
#include <string_view>
#include <utility>

#include <boost/stacktrace.hpp>
#include <fmt/format.h>

namespace daddeck::core
{
    // Error payload carrying where it was raised and how we got there.
    template <typename T>
    class OmegaException
    {
    public:
        OmegaException(std::string err_str,
                       T usr_data,
                       std::source_location const& src_loc = std::source_location::current(),
                       boost::stacktrace::stacktrace backtrace = boost::stacktrace::stacktrace()) :
            err_str_{std::move(err_str)},
            usr_data_{std::move(usr_data)},
            src_loc_{src_loc},
            backtrace_{std::move(backtrace)}
        {
        }

        [[nodiscard]]
        auto what() -> std::string& { return err_str_; }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        [[nodiscard]]
        auto stack() const noexcept -> boost::stacktrace::stacktrace const& { return backtrace_; }

        auto data() -> T& { return usr_data_; }
        auto data() const noexcept -> T const& { return usr_data_; }

        [[nodiscard]]
        auto to_str() const -> std::string
        {
            std::string s = fmt::format("{}({}:{}), function `{}`\n", src_loc_.file_name(), src_loc_.line(),
                                        src_loc_.column(), src_loc_.function_name());
            // the last frames are libc/startup noise
            auto const& frames = backtrace_.as_vector();
            auto const shown = frames.size() > 3 ? frames.size() - 3 : frames.size();
            for (std::size_t i = 0; i < shown; ++i)
            {
                s += fmt::format("{}({}):{}\n", frames[i].source_file(), frames[i].source_line(), frames[i].name());
            }
            return s;
        }

    private:
        std::string err_str_;
        T usr_data_;
        std::source_location src_loc_;
        boost::stacktrace::stacktrace backtrace_;
    };
}

// lets fmt::print("{}", e) render the full report
template <class T>
struct fmt::formatter<daddeck::core::OmegaException<T>> : fmt::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(daddeck::core::OmegaException<T> const& p, FormatContext& ctx) const
    {
        std::string s = fmt::format("Failed to process with code ({}): {}\n{}\n", static_cast<int>(p.data()), p.what(),
                                    p.to_str());
        return fmt::formatter<std::string_view>::format(s, ctx);
    }
};

#endif //DADDECK_OMEGAEXCEPTION_HPP
