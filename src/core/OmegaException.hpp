//
// OmegaException.hpp
//

#ifndef LTCG_OMEGAEXCEPTION_HPP
#define LTCG_OMEGAEXCEPTION_HPP

#include <cstddef>
#include <format>
#include <source_location>
#include <stacktrace>
#include <string>

namespace ltcg::core
{
    // Thrown for engine misuse only; an illegal command is never an exception.
    // Code is the category enum; it is rendered through an ADL-visible to_string(Code).
    template <typename Code>
    class OmegaException
    {
    public:
        static constexpr std::size_t MaxFrames{24};

        OmegaException(std::string message,
                       Code code,
                       std::source_location const& origin = std::source_location::current(),
                       std::stacktrace trace = std::stacktrace::current(1)) :
            message_{std::move(message)},
            code_{code},
            origin_{origin},
            trace_{std::move(trace)}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return message_; }

        [[nodiscard]]
        auto code() const noexcept -> Code { return code_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return origin_; }

        [[nodiscard]]
        auto stack() const noexcept -> std::stacktrace const& { return trace_; }

        // Origin line, then up to MaxFrames resolved frames; frames without symbols are skipped.
        [[nodiscard]]
        auto to_str() const -> std::string
        {
            std::string out = std::format("at {}:{} in `{}`\n", origin_.file_name(), origin_.line(),
                                          origin_.function_name());
            std::size_t shown{};
            for (std::stacktrace_entry const& frame : trace_)
            {
                if (shown == MaxFrames)
                {
                    out += "  ...\n";
                    break;
                }
                if (frame.description().empty())
                    continue;
                out += std::format("  #{} {} ({}:{})\n", shown++, frame.description(), frame.source_file(),
                                   frame.source_line());
            }
            return out;
        }

    private:
        std::string message_;
        Code code_;
        std::source_location origin_;
        std::stacktrace trace_;
    };
}

// std::print("{}", e) support.
template <class Code>
struct std::formatter<ltcg::core::OmegaException<Code>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(ltcg::core::OmegaException<Code> const& e, FormatContext& ctx) const
    {
        std::string const s = std::format("[ltcg] {} error: {}\n{}", to_string(e.code()), e.what(), e.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};

#endif //LTCG_OMEGAEXCEPTION_HPP
