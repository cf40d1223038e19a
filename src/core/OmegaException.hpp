#ifndef TRACTORENGINE_OMEGAEXCEPTION_HPP
#define TRACTORENGINE_OMEGAEXCEPTION_HPP

#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>
#include <utility>

namespace tractor::core
{
    // Engine misuse. Carries a category code, the call site that raised it and
    // the stack captured at construction (after "Exceptionally bad", CppCon 2023).
    template <typename Code>
    class OmegaException
    {
    public:
        OmegaException(std::string message,
                       Code code,
                       std::source_location const& site = std::source_location::current(),
                       std::stacktrace trace = std::stacktrace::current()) :
            message_{std::move(message)},
            code_{code},
            site_{site},
            trace_{std::move(trace)}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return message_; }

        [[nodiscard]]
        auto code() const noexcept -> Code { return code_; }

        [[nodiscard]]
        auto site() const noexcept -> std::source_location const& { return site_; }

        [[nodiscard]]
        auto trace() const noexcept -> std::stacktrace const& { return trace_; }

        // Call site, then one indented line per frame, innermost first.
        [[nodiscard]]
        auto to_str() const -> std::string
        {
            std::string s = std::format("{}:{} in {}\n", site_.file_name(), site_.line(), site_.function_name());
            for (std::stacktrace_entry const& frame : trace_)
            {
                if (frame.source_file().empty()) s += std::format("  {}\n", frame.description());
                else s += std::format("  {}:{} {}\n", frame.source_file(), frame.source_line(), frame.description());
            }
            return s;
        }

    private:
        std::string message_;
        Code code_;
        std::source_location site_;
        std::stacktrace trace_;
    };
}

// std::print("{}", e) gives the code, the message and the trace.
template <class Code>
struct std::formatter<tractor::core::OmegaException<Code>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(tractor::core::OmegaException<Code> const& e, FormatContext& ctx) const
    {
        std::string const s = std::format("error {}: {}\n{}", std::to_underlying(e.code()), e.what(), e.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};

#endif //TRACTORENGINE_OMEGAEXCEPTION_HPP
