/**
 * @file process.hpp
 * @brief Spawning external programs and collecting their output by line.
 */

#ifndef SONORA_PROCESS_HPP
#define SONORA_PROCESS_HPP

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace sonora {

/**
 * @brief Receives one line of child output, without its trailing newline.
 */
using LineSink = std::function<void(std::string_view line)>;

/**
 * @brief Spawn @p args with the inherited environment and wait for it to exit.
 *
 * @details args[0] is run as given when it contains a '/', otherwise it is
 * looked up on PATH. Standard input is connected to the
 * null device. Both output streams are multiplexed with poll(2): the loop
 * forwards every complete line currently available on stdout to
 * @p stdout_sink and on stderr to @p stderr_sink, then checks whether the
 * child has exited, and repeats until it has. Output of a stream without a
 * sink is read and discarded. Remaining output is flushed after exit,
 * including a final line without newline.
 *
 * There is no timeout: a child that never exits blocks the caller.
 *
 * @return Exit status, or the negated signal number when the child was killed.
 * @throws std::invalid_argument if @p args is empty.
 * @throws std::system_error if pipes or spawn file actions cannot be set up,
 * or the program cannot be started.
 */
int run_process(const std::vector<std::string>& args,
                const LineSink& stdout_sink = {},
                const LineSink& stderr_sink = {});

} // namespace sonora

#endif // SONORA_PROCESS_HPP
