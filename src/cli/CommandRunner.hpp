/**
 * klog - Command Runner
 *
 * Command-line operations on an entry store.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace klog {

class EntryStore;
class LogEntry;

/**
 * Exit codes of the klog executable
 */
enum class ExitCode : int {
    Success = 0,
    UsageError = 1,     // bad arguments or unknown entry
    FormatFailure = 2,  // entry text rejected
    IoFailure = 3       // reading input or saving failed
};

/**
 * Executes one klog command against a store
 *
 * Commands:
 *   list                       entries grouped by year, with ordinals
 *   show <n>                   text of entry n
 *   template [YYYY-MM-DD]      editable template, today by default
 *   new <file|->               create an entry from text
 *   edit <n> <file|->          replace entry n with text
 *   remove <n>                 delete entry n
 *   attach <n> <file>          attach a file to entry n
 *   detach <n> <m>             remove attachment m of entry n
 *
 * "-" reads the text from the input stream.
 */
class CommandRunner {
public:
    CommandRunner(EntryStore& store, std::istream& in, std::ostream& out, std::ostream& err);

    /**
     * Run a command
     *
     * @param args Command name followed by its arguments
     */
    ExitCode run(const std::vector<std::string>& args);

    /**
     * Usage text listing the commands
     */
    static std::string usage();

private:
    ExitCode list();
    ExitCode show(const std::vector<std::string>& args);
    ExitCode printTemplate(const std::vector<std::string>& args);
    ExitCode create(const std::vector<std::string>& args);
    ExitCode edit(const std::vector<std::string>& args);
    ExitCode remove(const std::vector<std::string>& args);
    ExitCode attach(const std::vector<std::string>& args);
    ExitCode detach(const std::vector<std::string>& args);

    LogEntry* lookup(const std::string& ordinal);
    std::string readInput(const std::string& source);
    ExitCode commitChanges(const std::string& action);

    EntryStore& m_store;
    std::istream& m_in;
    std::ostream& m_out;
    std::ostream& m_err;
};

} // namespace klog
