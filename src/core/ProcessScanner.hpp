#pragma once
#include <QString>
#include <memory>
#include <string>
#include <vector>

namespace usb_audio {

struct ProcessEntry {
    long long pid{0};
    std::vector<std::string> arguments;

    std::string program() const;      // basename of argv[0]
    std::string commandLine() const;  // arguments joined by spaces
};

// Finds processes by their command line under a procfs root and signals them.
class ProcessScanner {
public:
    explicit ProcessScanner(const QString& procRoot);
    ~ProcessScanner();

    std::vector<ProcessEntry> listProcesses() const;

    // Processes whose command line contains the text. An empty program
    // matches any executable.
    std::vector<ProcessEntry> findByCommandLine(const std::string& text,
                                                const std::string& program = {}) const;

    // Processes started as program with one argument equal to the given one.
    std::vector<ProcessEntry> findByArgument(const std::string& argument,
                                             const std::string& program) const;

    // SIGTERM, then SIGKILL for whatever is still present after timeoutMs.
    // Returns the number of processes that were signalled.
    int terminate(const std::vector<ProcessEntry>& processes, int timeoutMs) const;

    static std::vector<std::string> parseCommandLine(const QByteArray& raw);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
