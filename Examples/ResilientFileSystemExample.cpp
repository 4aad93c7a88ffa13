#include <cstring>
#include <filesystem>
#include <memory>
#include <string>

#include "Concurrency/WorkContractGroup.h"
#include "Concurrency/WorkService.h"
#include "FileSystem/RecoveryPrompts.h"
#include "FileSystem/ResilientFileSystem.h"
#include "Logging/Logger.h"

using namespace Steadfast::Core;
using namespace Steadfast::Core::Concurrency;
using namespace Steadfast::Core::IO;

static bool report(const char* what, const FileOperationHandle& h) {
    h.wait();
    if (h.status() == FileOpStatus::Complete) {
        STEADFAST_LOG_INFO(std::string(what) + " ok (" + std::to_string(h.attempts()) + " attempt(s))");
        return true;
    }
    STEADFAST_LOG_ERROR(std::string(what) + " did not complete:\n" + h.errorInfo().trace);
    return false;
}

int main(int argc, char** argv) {
    // --interactive answers busy/access-denied prompts on the terminal
    const bool interactive = argc > 1 && std::strcmp(argv[1], "--interactive") == 0;

    WorkService svc({});
    WorkContractGroup group(128, "ResilientFS_Example");
    svc.start();
    svc.addWorkContractGroup(&group);

    ResilientFileSystem::Dependencies deps;
    if (interactive) {
        deps.prompt = std::make_shared<ConsolePrompt>();
    }
    ResilientFileSystem fs(&group, {}, deps);

    const auto root = std::filesystem::temp_directory_path() / "steadfast_example";
    const auto settings = (root / "settings.json").string();
    const auto staging = (root / "settings.json.tmp").string();
    const auto backup = (root / "settings.json.bak").string();

    bool ok = report("ensureDirWritable", fs.ensureDirWritable(root.string()));

    // Write-then-rename keeps the previous settings intact until the new file is complete
    ok = ok && report("writeFile", fs.writeFile(staging, std::string_view("{\"theme\":\"dark\"}\n")));
    ok = ok && report("rename", fs.rename(staging, settings));
    ok = ok && report("copy", fs.copy(settings, backup));

    // Copying a file onto itself is refused before any data is touched
    auto self = fs.copy(settings, settings);
    self.wait();
    STEADFAST_LOG_INFO(std::string("self-copy refused: ") + fileErrorToString(self.errorInfo().code));

    auto read = fs.readFile(backup);
    if (report("readFile", read)) {
        STEADFAST_LOG_INFO("backup holds " + read.contentsText());
    }

    // Deletes succeed whether or not the target is still there
    report("unlink", fs.unlink(backup));
    report("unlink (again)", fs.unlink(backup));
    report("remove", fs.remove(root.string()));

    group.wait();
    svc.removeWorkContractGroup(&group);
    svc.stop();
    return ok ? 0 : 1;
}
