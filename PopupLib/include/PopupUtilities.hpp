#pragma once

#include <source_location>
#include <stdexcept>
#include <string>

namespace util
{
    /**
     * @brief Create a runtime_error enriched with source location info.
     *
     * Example output:
     *   Popup layer can only be installed into a window root [at PopupManager.cpp:57 in PopupManager::popupLayerForWindow(...)]
     */
    inline std::runtime_error popup_exception(
        const std::string&   msg,
        std::source_location loc = std::source_location::current())
    {
        std::string file = loc.file_name();
        if (auto pos = file.find_last_of("/\\"); pos != std::string::npos)
            file = file.substr(pos + 1);

        std::string func = loc.function_name();

        // Replace parameter list with "..."
        if (auto open = func.find('('); open != std::string::npos)
        {
            if (auto close = func.rfind(')'); close != std::string::npos && close > open)
            {
                func.replace(open + 1, close - open - 1, "...");
            }
        }

        return std::runtime_error(
            msg + " [at " + file + ":" + std::to_string(loc.line()) +
            " in " + func + "]");
    }

} // namespace util
