#define CMDTREE_LOG_DISPATCH_LEVEL 3
#define CMDTREE_LOG_REGISTRY_LEVEL 4
#include "cmdtree/logging.hpp"

#include <cassert>
#include <cstdio>
#include <string>

namespace {

std::string read_all(FILE* file) {
    fflush(file);
    rewind(file);
    std::string content;
    char buffer[256];
    size_t count = 0;
    while ((count = fread(buffer, 1, sizeof(buffer), file)) > 0) {
        content.append(buffer, count);
    }
    return content;
}

} // namespace

int main() {
    FILE* capture = tmpfile();
    assert(capture != nullptr);
    cmdtree::logging::set_output(capture);

    CMDTREE_LOG_DISPATCH_INFO("dispatching to '%s'", "pull");
    CMDTREE_LOG_DISPATCH_WARN("no sub-command '%s'", "foo");
    // Above the compiled level: no output.
    CMDTREE_LOG_DISPATCH_DEBUG("hidden %d", 1);
    CMDTREE_LOG_DISPATCH_TRACE("hidden %d", 2);
    CMDTREE_LOG_REGISTRY_DEBUG("constructing %s", "PullCommand");

    cmdtree::logging::set_output(nullptr);
    assert(cmdtree::logging::output() == stderr);

    const std::string content = read_all(capture);
    fclose(capture);

    assert(content.find("[INFO] [dispatch] dispatching to 'pull'\n") != std::string::npos);
    assert(content.find("[WARN] [dispatch] no sub-command 'foo'\n") != std::string::npos);
    assert(content.find("[DEBUG] [registry] constructing PullCommand\n") != std::string::npos);
    assert(content.find("hidden") == std::string::npos);
    assert(content.front() == '[');

    size_t lines = 0;
    for (char c : content) {
        if (c == '\n') ++lines;
    }
    assert(lines == 3);
    return 0;
}
