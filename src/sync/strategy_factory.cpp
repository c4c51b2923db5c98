#include "sync/strategy_factory.hpp"
#include "cache/redis_sync.hpp"
#include "common/logger.hpp"
#include "database/mysql_sync.hpp"
#include "database/postgres_sync.hpp"
#include "storage/filesystem_transport.hpp"
#include "storage/mc_transport.hpp"
#include "storage/object_storage_sync.hpp"
#include "storage/rclone_transport.hpp"

namespace {

std::shared_ptr<ObjectStorageSync> createObjectStorage(const std::string& name, const std::string& defaultEngine,
                                                       const SyncConfig& config,
                                                       const std::shared_ptr<RcloneTransport>& rclone,
                                                       const std::shared_ptr<McTransport>& mc,
                                                       const std::shared_ptr<FilesystemTransport>& filesystem) {
    auto strategy = std::make_shared<ObjectStorageSync>(name, defaultEngine);
    strategy->addTransport("rclone", rclone);
    strategy->addTransport("mc", mc);
    strategy->addTransport("filesystem", filesystem);
    strategy->setManifestDirectory(joinObjectPath(config.stagingDirectory, "manifests"));
    return strategy;
}

} // namespace

StrategyRegistryPtr createDefaultRegistry(const SyncConfig& config) {
    auto registry = std::make_shared<StrategyRegistry>();

    auto postgres = std::make_shared<PostgresSync>();
    postgres->setTools(config.tools.pgDump, config.tools.pgRestore, config.tools.psql);
    registry->registerStrategy(postgres);

    auto mysql = std::make_shared<MysqlSync>();
    mysql->setTools(config.tools.mysqldump, config.tools.mysql);
    registry->registerStrategy(mysql);

    for (auto strategy : {std::make_shared<RedisSync>("redis", RedisSync::Mode::PIPELINE),
                          std::make_shared<RedisSync>("redis-replication", RedisSync::Mode::REPLICATION)}) {
        strategy->setLoaderProgram(config.tools.rdb);
        strategy->setCliProgram(config.tools.redisCli);
        registry->registerStrategy(strategy);
    }

    // Remotes configured once are shared by both object storage strategies.
    auto rclone = std::make_shared<RcloneTransport>(config.tools.rclone);
    auto mc = std::make_shared<McTransport>(config.tools.mc);
    auto filesystem = std::make_shared<FilesystemTransport>();
    registry->registerStrategy(createObjectStorage("minio", "", config, rclone, mc, filesystem));
    registry->registerStrategy(createObjectStorage("rclone", "rclone", config, rclone, mc, filesystem));

    Logger::debug("Registered " + std::to_string(registry->listNames().size()) + " sync strategies");
    return registry;
}
