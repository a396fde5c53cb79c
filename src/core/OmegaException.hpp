#ifndef TABLETURF_OMEGAEXCEPTION_HPP
#define TABLETURF_OMEGAEXCEPTION_HPP

#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>
#include <utility>

namespace tableturf::core
{
    //inspired by CPPCon2023 "Exceptionally bad" by Peter Muldoon
    // Carries the message, a typed code, the throw site and the trace leading to it.
    template <typename T>
    class OmegaException
    {
    public:
        OmegaException(std::string message,
                       T code,
                       std::source_location const& site,
                       std::stacktrace trace = std::stacktrace::current(1)) :
            message_{std::move(message)},
            code_{std::move(code)},
            site_{site},
            trace_{std::move(trace)}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return message_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return site_; }

        [[nodiscard]]
        auto stack() const noexcept -> std::stacktrace const& { return trace_; }

        [[nodiscard]]
        auto code() const noexcept -> T const& { return code_; }

        [[nodiscard]]
        auto to_str() const -> std::string
        {
            std::string s = std::format("{}({}:{}), function `{}`\n", site_.file_name(), site_.line(),
                                        site_.column(), site_.function_name());
            for (auto const& entry : trace_)
            {
                s += std::format("{}({}):{}\n", entry.source_file(), entry.source_line(), entry.description());
            }
            return s;
        }

    private:
        std::string message_;
        T code_;
        std::source_location site_;
        std::stacktrace trace_;
    };
}

//extension to std format to allow use with std::print();
template <class T>
struct std::formatter<tableturf::core::OmegaException<T>> : std::formatter<std::string_view>
{
    constexpr auto parse(std::format_parse_context& ctx)
    {
        return std::formatter<std::string_view>::parse(ctx);
    }

    template <class FormatContext>
    auto format(tableturf::core::OmegaException<T> const& p, FormatContext& ctx) const
    {
        std::string s = std::format("Failed to process with code ({}): {}\n{}\n", static_cast<int>(p.code()), p.what(),
                                    p.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};
#endif //TABLETURF_OMEGAEXCEPTION_HPP
