#include "storage/mc_transport.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "storage/transfer_stats.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

McTransport::McTransport(const std::string& program)
    : program_(program) {
}

std::string McTransport::getAliasName(const Endpoint& endpoint) {
    std::string base = endpoint.type + "_" + endpoint.host + "_" + endpoint.region;
    if (endpoint.port > 0) {
        base += "_" + std::to_string(endpoint.port);
    }
    return "ds_" + utils::sanitizeName(base);
}

std::string McTransport::getAliasUrl(const Endpoint& endpoint) {
    if (endpoint.type == "s3") {
        if (!endpoint.region.empty()) {
            return "https://s3." + endpoint.region + ".amazonaws.com";
        }
        return "https://s3.amazonaws.com";
    }
    if (endpoint.type == "gcs") {
        return "https://storage.googleapis.com";
    }
    if (endpoint.type == "azure-blob") {
        if (endpoint.host.empty()) {
            throw SyncError(SyncError::Category::CONFIGURATION, "azure-blob endpoint requires the account name as host");
        }
        return "https://" + endpoint.host + ".blob.core.windows.net";
    }
    if (endpoint.type == "minio") {
        if (endpoint.host.empty()) {
            throw SyncError(SyncError::Category::CONFIGURATION, "minio endpoint requires a host");
        }
        std::string url = std::string(endpoint.ssl ? "https" : "http") + "://" + endpoint.host;
        if (endpoint.port > 0) {
            url += ":" + std::to_string(endpoint.port);
        }
        return url;
    }
    throw SyncError(SyncError::Category::CONFIGURATION, "mc does not support endpoint type: " + endpoint.type);
}

std::string McTransport::buildHostValue(const Endpoint& endpoint) {
    std::string url = getAliasUrl(endpoint);
    const Credentials& creds = endpoint.credentials;
    if (creds.accessKey.empty() && creds.secretKey.empty()) {
        return url;
    }
    auto schemeEnd = url.find("://");
    std::string userInfo = utils::urlEncode(creds.accessKey) + ":" + utils::urlEncode(creds.secretKey);
    if (!creds.token.empty()) {
        userInfo += ":" + utils::urlEncode(creds.token);
    }
    return url.substr(0, schemeEnd + 3) + userInfo + "@" + url.substr(schemeEnd + 3);
}

std::string McTransport::buildPath(const Endpoint& endpoint) {
    return joinObjectPath(joinObjectPath(getAliasName(endpoint), endpoint.bucket), endpoint.path);
}

std::vector<std::string> McTransport::buildMirrorArgs(const std::string& sourcePath, const std::string& targetPath,
                                                      const SyncOptions& options) {
    std::vector<std::string> args = {"mirror", "--overwrite"};
    if (options.deleteExtraneous) {
        args.push_back("--remove");
    }
    if (options.dryRun) {
        args.push_back("--fake");
    }
    if (options.bandwidthBytesPerSec > 0) {
        args.push_back("--limit-upload");
        args.push_back(std::to_string(options.bandwidthBytesPerSec) + "B");
    }
    args.push_back(sourcePath);
    args.push_back(targetPath);
    return args;
}

CommandSpec McTransport::makeCommand(const std::vector<std::string>& args,
                                     std::initializer_list<const Endpoint*> endpoints) const {
    CommandSpec command;
    command.program = program_;
    command.args = {"--no-color"};
    command.args.insert(command.args.end(), args.begin(), args.end());
    for (const Endpoint* endpoint : endpoints) {
        command.env["MC_HOST_" + getAliasName(*endpoint)] = buildHostValue(*endpoint);
    }
    return command;
}

ProcessResult McTransport::runTool(const SyncContext& ctx, const CommandSpec& command) const {
    ProcessResult result = Subprocess::run(command, ctx.token.get());
    if (result.cancelled || ctx.isCancelled()) {
        throw SyncError(SyncError::Category::CANCELLED, "mc cancelled: " + ctx.token->getReason());
    }
    return result;
}

void McTransport::checkResult(const ProcessResult& result, const std::string& what,
                              SyncError::Category category) const {
    if (result.exitCode != 0) {
        throw SyncError(category, "mc " + what + " failed (exit " + std::to_string(result.exitCode) +
                                      "): " + utils::trim(result.stderrText));
    }
}

void McTransport::prepare(const SyncContext& ctx, const Endpoint& endpoint) {
    (void)ctx;
    // Validates the provider mapping; aliases themselves travel per call.
    getAliasUrl(endpoint);
}

StorageUsage McTransport::usage(const SyncContext& ctx, const Endpoint& endpoint) {
    ProcessResult result = runTool(ctx, makeCommand({"du", "--json", buildPath(endpoint)}, {&endpoint}));
    checkResult(result, "du", SyncError::Category::CONNECTIVITY);

    StorageUsage total;
    for (const auto& line : utils::split(result.stdoutText, '\n')) {
        if (utils::trim(line).empty()) {
            continue;
        }
        try {
            json entry = json::parse(line);
            total.bytes += entry.value("size", static_cast<int64_t>(0));
            total.count += entry.value("objects", static_cast<int64_t>(0));
        } catch (const json::exception& e) {
            throw SyncError(SyncError::Category::PROTOCOL, std::string("unparseable mc du output: ") + e.what());
        }
    }
    return total;
}

std::vector<ObjectInfo> McTransport::listObjects(const SyncContext& ctx, const Endpoint& endpoint) {
    ProcessResult result =
        runTool(ctx, makeCommand({"ls", "--recursive", "--json", buildPath(endpoint)}, {&endpoint}));
    checkResult(result, "ls", SyncError::Category::CONNECTIVITY);

    std::vector<ObjectInfo> objects;
    for (const auto& line : utils::split(result.stdoutText, '\n')) {
        if (utils::trim(line).empty()) {
            continue;
        }
        try {
            json entry = json::parse(line);
            if (entry.value("type", "file") != "file") {
                continue;
            }
            ObjectInfo object;
            object.key = entry.value("key", "");
            object.size = entry.value("size", static_cast<int64_t>(0));
            object.etag = entry.value("etag", "");
            object.modified = entry.value("lastModified", "");
            objects.push_back(std::move(object));
        } catch (const json::exception& e) {
            throw SyncError(SyncError::Category::PROTOCOL, std::string("unparseable mc ls output: ") + e.what());
        }
    }
    return objects;
}

void McTransport::ensureContainer(const SyncContext& ctx, const Endpoint& endpoint) {
    std::string bucketPath = joinObjectPath(getAliasName(endpoint), endpoint.bucket);
    ProcessResult result = runTool(ctx, makeCommand({"mb", "--ignore-existing", bucketPath}, {&endpoint}));
    checkResult(result, "mb", SyncError::Category::TRANSFER);
}

void McTransport::copyObject(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                             const std::string& key) {
    CommandSpec command = makeCommand({"cp", joinObjectPath(buildPath(source), key),
                                       joinObjectPath(buildPath(target), key)},
                                      {&source, &target});
    checkResult(runTool(ctx, command), "cp " + key, SyncError::Category::TRANSFER);
}

void McTransport::mirror(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                         ProgressReporter& reporter) {
    prepare(ctx, source);
    prepare(ctx, target);
    if (!ctx.options.dryRun) {
        try {
            ensureContainer(ctx, target);
        } catch (const SyncError& e) {
            if (e.isCancellation()) {
                throw;
            }
            Logger::warning(std::string("Could not create target bucket: ") + e.what());
            reporter.warning(std::string("failed to create bucket: ") + e.what());
        }
    }

    CommandSpec command = makeCommand(buildMirrorArgs(buildPath(source), buildPath(target), ctx.options),
                                      {&source, &target});
    auto onLine = [&reporter](const std::string& line) {
        TransferStats stats = parseMcLine(line);
        if (stats.isError) {
            reporter.error(line);
        } else if (!stats.currentItem.empty()) {
            reporter.setCurrentItem(stats.currentItem);
            reporter.incrementItems();
        }
    };

    Subprocess process(command);
    process.captureStdout(onLine);
    process.captureStderr();
    if (!process.start()) {
        throw SyncError(SyncError::Category::TRANSFER, process.getLastError());
    }
    int exitCode = process.wait(ctx.token.get());
    if (process.wasTerminated() || ctx.isCancelled()) {
        throw SyncError(SyncError::Category::CANCELLED, "mc mirror cancelled: " + ctx.token->getReason());
    }
    if (exitCode != 0) {
        throw SyncError(SyncError::Category::TRANSFER, "mc mirror failed (exit " + std::to_string(exitCode) +
                                                           "): " + utils::trim(process.getStderr()));
    }
}
