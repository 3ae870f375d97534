#ifndef CMDTREE_IO_SERVICE_HPP
#define CMDTREE_IO_SERVICE_HPP

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace cmdtree {

class IoService {
public:
    virtual ~IoService() = default;

    virtual void write(std::string_view text) = 0;
    virtual void write_line(std::string_view text = {}) = 0;
    virtual void write_error(std::string_view text) = 0;
    virtual void write_error_line(std::string_view text) = 0;

    // Empty at end of input.
    virtual std::optional<std::string> read_line() = 0;
    virtual std::optional<char> read_key() = 0;
};

class StreamIoService : public IoService {
public:
    StreamIoService(std::istream& in, std::ostream& out, std::ostream& err);

    void write(std::string_view text) override;
    void write_line(std::string_view text = {}) override;
    void write_error(std::string_view text) override;
    void write_error_line(std::string_view text) override;

    std::optional<std::string> read_line() override;
    std::optional<char> read_key() override;

protected:
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
};

// Process streams. Errors are printed dark red when stderr is a terminal and
// read_key() switches stdin to raw mode for the duration of one key press.
class ConsoleIoService : public StreamIoService {
public:
    ConsoleIoService();

    void write_error(std::string_view text) override;
    void write_error_line(std::string_view text) override;

    std::optional<char> read_key() override;

private:
    bool colour_errors_;
};

} // namespace cmdtree

#endif // CMDTREE_IO_SERVICE_HPP
