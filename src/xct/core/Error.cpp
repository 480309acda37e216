#include "xct/core/Error.hpp"

namespace xct {
    auto Exception::format_(
        const char* file,
        const char* function,
        std::uint_least32_t line,
        std::string_view message
    ) -> std::string {
        // Report paths relative to the source tree, e.g. "xct/core/types/Grid.cpp".
        std::string_view path(file);
        if (const usize idx = path.rfind("xct/"); idx != std::string_view::npos)
            path.remove_prefix(idx);
        return fmt::format("ERROR:{}:{}:{}: {}", path, function, line, message);
    }

    void Exception::backtrace_(
        std::vector<std::string>& message,
        const std::exception_ptr& exception_ptr
    ) {
        std::exception_ptr current = exception_ptr;
        while (current) {
            try {
                std::rethrow_exception(current);
            } catch (const std::exception& e) {
                message.emplace_back(e.what());
                const auto* nested = dynamic_cast<const std::nested_exception*>(&e);
                current = nested ? nested->nested_ptr() : nullptr;
            } catch (...) {
                message.emplace_back("ERROR: Unknown exception type. Stopping the backtrace");
                current = nullptr;
            }
        }
    }
}
