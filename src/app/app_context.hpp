#pragma once

#include "app/config.hpp"
#include "app/init_controller.hpp"
#include "import/bulk_importer.hpp"
#include "storage/budget_repository.hpp"
#include "storage/category_repository.hpp"
#include "storage/storage_engine.hpp"
#include "storage/sync_state_repository.hpp"
#include "storage/transaction_repository.hpp"
#include "sync/authenticator.hpp"
#include "sync/sync_adapter.hpp"
#include <memory>

namespace tally::app {

/**
 * AppContext - Wires the engine, repositories, importer, sync adapter and
 * init controller for one database.
 */
class AppContext {
public:
    explicit AppContext(AppConfig config);
    ~AppContext();

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    InitStatus initialize();

    [[nodiscard]] const AppConfig& config() const { return config_; }
    [[nodiscard]] storage::StorageEngine& engine() { return engine_; }
    [[nodiscard]] storage::CategoryRepository& categories() { return categories_; }
    [[nodiscard]] storage::TransactionRepository& transactions() { return transactions_; }
    [[nodiscard]] storage::BudgetRepository& budgets() { return budgets_; }
    [[nodiscard]] storage::SyncStateRepository& sync_state() { return sync_state_; }
    [[nodiscard]] importer::BulkImporter& importer() { return importer_; }
    [[nodiscard]] sync::SyncAdapter& sync_adapter() { return adapter_; }
    [[nodiscard]] InitController& controller() { return controller_; }

private:
    [[nodiscard]] sync::BlobStoreFactory make_store_factory() const;

    AppConfig config_;
    storage::StorageEngine engine_;
    storage::CategoryRepository categories_;
    storage::TransactionRepository transactions_;
    storage::BudgetRepository budgets_;
    storage::SyncStateRepository sync_state_;
    importer::BulkImporter importer_;
    sync::SyncAdapter adapter_;
    std::unique_ptr<sync::Authenticator> authenticator_;
    InitController controller_;
};

} // namespace tally::app
