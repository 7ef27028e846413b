/**
 * @file console.hpp
 * @brief Interactive prompts on the controlling terminal.
 */

#ifndef CONSOLE_HPP
#define CONSOLE_HPP

#include <optional>
#include <string>

class Console {
public:
    /**
     * @brief Prompts on stderr and reads one line from stdin with echo.
     *
     * @return The line, or std::nullopt at end of input.
     */
    static std::optional<std::string> ask(const std::string& prompt);

    /**
     * @brief Like ask(), with terminal echo switched off while typing.
     *
     * Reads from /dev/tty so a secret can be typed while stdin carries pipeline input.
     */
    static std::optional<std::string> askSecret(const std::string& prompt);

    /**
     * @brief Reads one newline-terminated line from @p fd, without the newline.
     *
     * A line cut short by a read error, an interrupt or end of input on a
     * terminal yields std::nullopt, never the partial text.
     */
    static std::optional<std::string> readLine(int fd);
};

#endif // CONSOLE_HPP
