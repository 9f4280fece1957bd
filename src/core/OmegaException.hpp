//
// OmegaException.hpp
//

#ifndef NIKOLI_OMEGAEXCEPTION_HPP
#define NIKOLI_OMEGAEXCEPTION_HPP

#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>
#include <utility>

namespace nikoli::core
{
    // Exception carrying a payload (normally an error code), the throw site and a backtrace.
    template <typename T>
    class OmegaException
    {
    public:
        OmegaException(std::string err_str,
                       T usr_data,
                       std::source_location const& src_loc = std::source_location::current(),
                       std::stacktrace backtrace = std::stacktrace::current()) :
            err_str_{std::move(err_str)},
            usr_data_{std::move(usr_data)},
            src_loc_{src_loc},
            backtrace_{std::move(backtrace)}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        auto data() const noexcept -> T const& { return usr_data_; }

        [[nodiscard]]
        auto to_str() const -> std::string
        {
            std::string s = std::format("{}({}:{}), function `{}`\n", src_loc_.file_name(), src_loc_.line(),
                                        src_loc_.column(), src_loc_.function_name());
            // the innermost frames belong to fail() and this constructor
            constexpr std::size_t skipped = 3;
            if (backtrace_.size() <= skipped)
            {
                return s;
            }
            for (auto it = backtrace_.begin(); it != (backtrace_.end() - skipped); ++it)
            {
                s += std::format("{}({}):{}\n", it->source_file(), it->source_line(), it->description());
            }
            return s;
        }

    private:
        std::string err_str_;
        T usr_data_;
        std::source_location src_loc_;
        std::stacktrace backtrace_;
    };
}

template <class T>
struct std::formatter<nikoli::core::OmegaException<T>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(nikoli::core::OmegaException<T> const& p, FormatContext& ctx) const
    {
        std::string s = std::format("Failed with code ({}): {}\n{}", static_cast<int>(p.data()), p.what(),
                                    p.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};

#endif //NIKOLI_OMEGAEXCEPTION_HPP
