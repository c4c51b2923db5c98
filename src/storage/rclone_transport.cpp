#include "storage/rclone_transport.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "storage/transfer_stats.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string tail(const std::string& text) {
    std::string trimmed = utils::trim(text);
    if (trimmed.size() > 512) {
        return "..." + trimmed.substr(trimmed.size() - 512);
    }
    return trimmed;
}

StorageUsage parseSizeJson(const std::string& output) {
    try {
        json parsed = json::parse(output);
        StorageUsage result;
        result.bytes = parsed.value("bytes", static_cast<int64_t>(0));
        result.count = parsed.value("count", static_cast<int64_t>(0));
        return result;
    } catch (const json::exception& e) {
        throw SyncError(SyncError::Category::PROTOCOL, std::string("unparseable rclone size output: ") + e.what());
    }
}

} // namespace

RcloneTransport::RcloneTransport(const std::string& program)
    : program_(program) {
}

std::string RcloneTransport::sanitizeRemoteName(const std::string& name) {
    return utils::sanitizeName(name);
}

std::string RcloneTransport::getRemoteName(const Endpoint& endpoint) {
    if (endpoint.type == "s3") {
        return sanitizeRemoteName("s3_" + endpoint.region);
    }
    if (endpoint.type == "gcs") {
        return "gcs";
    }
    if (endpoint.type == "azure-blob") {
        return sanitizeRemoteName("azure_" + endpoint.host);
    }
    if (endpoint.type == "minio") {
        return sanitizeRemoteName("minio_" + endpoint.host + "_" + std::to_string(endpoint.port));
    }
    if (endpoint.type == "local") {
        return "local";
    }
    return sanitizeRemoteName(endpoint.type + "_remote");
}

std::string RcloneTransport::buildPath(const Endpoint& endpoint) {
    if (endpoint.type == "local") {
        return joinObjectPath(endpoint.bucket, endpoint.path);
    }
    std::string path = getRemoteName(endpoint) + ":" + endpoint.bucket;
    if (!endpoint.path.empty()) {
        path = joinObjectPath(path, endpoint.path);
    }
    return path;
}

std::vector<std::string> RcloneTransport::buildConfigArgs(const Endpoint& endpoint) {
    const std::string remote = getRemoteName(endpoint);
    const Credentials& creds = endpoint.credentials;
    std::vector<std::string> args;

    if (endpoint.type == "local") {
        return args;
    }
    if (endpoint.type == "s3") {
        args = {"config", "create", remote, "s3", "provider=AWS"};
        if (!endpoint.region.empty()) {
            args.push_back("region=" + endpoint.region);
        }
        if (!creds.accessKey.empty() || !creds.secretKey.empty()) {
            args.push_back("access_key_id=" + creds.accessKey);
            args.push_back("secret_access_key=" + creds.secretKey);
        } else {
            args.push_back("env_auth=true");
        }
    } else if (endpoint.type == "gcs") {
        args = {"config", "create", remote, "gcs", "bucket_policy_only=true"};
        if (!creds.keyFile.empty()) {
            args.push_back("service_account_file=" + creds.keyFile);
        }
        if (endpoint.hasOption("project")) {
            args.push_back("project_number=" + endpoint.getOption("project"));
        }
    } else if (endpoint.type == "azure-blob") {
        args = {"config", "create", remote, "azureblob"};
        if (!endpoint.host.empty()) {
            args.push_back("account=" + endpoint.host);
        }
        if (!creds.secretKey.empty()) {
            args.push_back("key=" + creds.secretKey);
        }
        if (!creds.token.empty()) {
            args.push_back("sas_url=" + creds.token);
        }
    } else if (endpoint.type == "minio") {
        std::string url = std::string(endpoint.ssl ? "https" : "http") + "://" + endpoint.host;
        if (endpoint.port > 0) {
            url += ":" + std::to_string(endpoint.port);
        }
        args = {"config", "create", remote, "s3", "provider=Minio", "endpoint=" + url};
        if (!creds.accessKey.empty()) {
            args.push_back("access_key_id=" + creds.accessKey);
        }
        if (!creds.secretKey.empty()) {
            args.push_back("secret_access_key=" + creds.secretKey);
        }
    } else {
        throw SyncError(SyncError::Category::CONFIGURATION, "rclone does not support endpoint type: " + endpoint.type);
    }
    return args;
}

std::vector<std::string> RcloneTransport::buildSyncArgs(const std::string& sourcePath, const std::string& targetPath,
                                                        const SyncOptions& options) {
    int parallel = options.parallel > 0 ? options.parallel : 4;
    // "sync" deletes target objects missing from the source; "copy" never does.
    std::vector<std::string> args = {
        options.deleteExtraneous ? "sync" : "copy", sourcePath, targetPath,
        "--transfers=" + std::to_string(parallel),
        "--checkers=" + std::to_string(parallel * 2),
        "--stats=1s", "--stats-one-line", "-v",
    };
    if (options.checksumVerify) {
        args.push_back("--checksum");
    }
    if (options.deleteExtraneous) {
        args.push_back("--delete-during");
    }
    if (options.bandwidthBytesPerSec > 0) {
        args.push_back("--bwlimit=" + std::to_string(options.bandwidthBytesPerSec) + "B");
    }
    if (options.dryRun) {
        args.push_back("--dry-run");
    }
    args.push_back("--retries=3");
    args.push_back("--low-level-retries=10");
    args.push_back("--s3-no-check-bucket");
    return args;
}

ProcessResult RcloneTransport::runTool(const SyncContext& ctx, const std::vector<std::string>& args) const {
    CommandSpec command;
    command.program = program_;
    command.args = args;
    ProcessResult result = Subprocess::run(command, ctx.token.get());
    if (result.cancelled || ctx.isCancelled()) {
        throw SyncError(SyncError::Category::CANCELLED, "rclone cancelled: " + ctx.token->getReason());
    }
    return result;
}

void RcloneTransport::checkResult(const ProcessResult& result, const std::string& what,
                                  SyncError::Category category) const {
    if (result.exitCode != 0) {
        throw SyncError(category, "rclone " + what + " failed (exit " + std::to_string(result.exitCode) +
                                      "): " + tail(result.stderrText));
    }
}

void RcloneTransport::prepare(const SyncContext& ctx, const Endpoint& endpoint) {
    std::string remote = getRemoteName(endpoint);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (configuredRemotes_.count(remote)) {
            return;
        }
    }

    std::vector<std::string> args = buildConfigArgs(endpoint);
    if (!args.empty()) {
        Logger::info("Configuring rclone remote " + remote);
        checkResult(runTool(ctx, args), "config create " + remote, SyncError::Category::CONFIGURATION);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    configuredRemotes_.insert(remote);
}

StorageUsage RcloneTransport::usage(const SyncContext& ctx, const Endpoint& endpoint) {
    prepare(ctx, endpoint);
    ProcessResult result = runTool(ctx, {"size", buildPath(endpoint), "--json"});
    checkResult(result, "size", SyncError::Category::CONNECTIVITY);
    return parseSizeJson(result.stdoutText);
}

std::vector<ObjectInfo> RcloneTransport::listObjects(const SyncContext& ctx, const Endpoint& endpoint) {
    prepare(ctx, endpoint);
    ProcessResult result = runTool(ctx, {"lsjson", buildPath(endpoint), "--recursive", "--files-only", "--hash"});
    checkResult(result, "lsjson", SyncError::Category::CONNECTIVITY);

    std::vector<ObjectInfo> objects;
    try {
        json entries = json::parse(result.stdoutText);
        for (const auto& entry : entries) {
            if (entry.value("IsDir", false)) {
                continue;
            }
            ObjectInfo object;
            object.key = entry.value("Path", "");
            object.size = entry.value("Size", static_cast<int64_t>(0));
            object.modified = entry.value("ModTime", "");
            if (entry.contains("Hashes") && entry["Hashes"].is_object()) {
                object.checksum = entry["Hashes"].value("md5", entry["Hashes"].value("MD5", ""));
            }
            objects.push_back(std::move(object));
        }
    } catch (const json::exception& e) {
        throw SyncError(SyncError::Category::PROTOCOL, std::string("unparseable rclone lsjson output: ") + e.what());
    }
    return objects;
}

void RcloneTransport::ensureContainer(const SyncContext& ctx, const Endpoint& endpoint) {
    prepare(ctx, endpoint);
    Endpoint container = endpoint;
    container.path.clear();
    checkResult(runTool(ctx, {"mkdir", buildPath(container)}), "mkdir");
}

void RcloneTransport::copyObject(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                                 const std::string& key) {
    std::vector<std::string> args = {"copyto", joinObjectPath(buildPath(source), key),
                                     joinObjectPath(buildPath(target), key)};
    if (ctx.options.checksumVerify) {
        args.push_back("--checksum");
    }
    checkResult(runTool(ctx, args), "copyto " + key);
}

void RcloneTransport::mirror(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                             ProgressReporter& reporter) {
    prepare(ctx, source);
    prepare(ctx, target);

    CommandSpec command;
    command.program = program_;
    command.args = buildSyncArgs(buildPath(source), buildPath(target), ctx.options);

    auto onLine = [&reporter](const std::string& line) {
        TransferStats stats = parseRcloneStatsLine(line);
        if (stats.isError) {
            reporter.error(line);
            return;
        }
        Progress current = reporter.getProgress();
        if (stats.itemsDone) {
            reporter.update(current.bytesDone, *stats.itemsDone,
                            std::to_string(*stats.itemsDone) + "/" + std::to_string(stats.itemsTotal.value_or(0)) +
                                " objects");
        } else if (stats.percent && current.bytesTotal > 0) {
            auto bytes = static_cast<int64_t>(static_cast<double>(current.bytesTotal) * *stats.percent / 100.0);
            reporter.update(bytes, current.itemsDone, std::to_string(static_cast<int>(*stats.percent)) + "% complete");
        }
    };

    Subprocess process(command);
    process.captureStdout(onLine);
    process.captureStderr(onLine);
    if (!process.start()) {
        throw SyncError(SyncError::Category::TRANSFER, process.getLastError());
    }
    int exitCode = process.wait(ctx.token.get());
    if (process.wasTerminated() || ctx.isCancelled()) {
        throw SyncError(SyncError::Category::CANCELLED, "rclone " + command.args[0] + " cancelled: " + ctx.token->getReason());
    }
    if (exitCode != 0) {
        throw SyncError(SyncError::Category::TRANSFER, "rclone " + command.args[0] + " failed (exit " + std::to_string(exitCode) +
                                                           "): " + tail(process.getStderr()));
    }
}

std::vector<std::string> RcloneTransport::checkOneWay(const SyncContext& ctx, const Endpoint& source,
                                                      const Endpoint& target) {
    prepare(ctx, source);
    prepare(ctx, target);
    ProcessResult result = runTool(ctx, {"check", buildPath(source), buildPath(target), "--one-way", "--combined", "-"});

    // "-" missing in target, "*" differs, "!" error while checking.
    std::vector<std::string> differences;
    for (const auto& rawLine : utils::split(result.stdoutText, '\n')) {
        std::string line = utils::trim(rawLine);
        if (!line.empty() && (line[0] == '-' || line[0] == '*' || line[0] == '!')) {
            differences.push_back(line);
        }
    }
    if (result.exitCode != 0 && differences.empty()) {
        checkResult(result, "check", SyncError::Category::CONNECTIVITY);
    }
    return differences;
}
