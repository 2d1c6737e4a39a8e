#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Ports
#include "ports/input/ICredentialService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IPasswordHasher.hpp"
#include "ports/output/ITokenProvider.hpp"
#include "ports/output/IClock.hpp"

// Application
#include "application/CredentialService.hpp"

// Secondary Adapters
#include "adapters/secondary/AuthSettings.hpp"
#include "adapters/secondary/DbSettings.hpp"
#include "adapters/secondary/HmacJwtAdapter.hpp"
#include "adapters/secondary/Pbkdf2PasswordHasher.hpp"
#include "adapters/secondary/PooledPasswordHasher.hpp"
#include "adapters/secondary/PostgresAccountRepository.hpp"
#include "adapters/secondary/SystemClock.hpp"

// Primary Adapters
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/RegisterHandler.hpp"
#include "adapters/primary/LoginHandler.hpp"
#include "adapters/primary/ChangePasswordHandler.hpp"
#include "adapters/primary/ProfileHandler.hpp"
#include "adapters/primary/TokenAuthMiddleware.hpp"

#include <WorkerPool.hpp>

#include <memory>
#include <iostream>

namespace di = boost::di;

namespace credentials {

/**
 * @brief Credential Service Application
 * 
 * Точка входа микросервиса учётных данных.
 * Настраивает Boost.DI контейнер и регистрирует HTTP handlers.
 */
class CredentialApp : public BoostBeastApplication {
public:
    CredentialApp() {
        std::cout << "[CredentialApp] Initializing..." << std::endl;
    }
    
    ~CredentialApp() override = default;

protected:
    void loadEnvironment(int argc, char* argv[]) override {
        BoostBeastApplication::loadEnvironment(argc, argv);

        // Без секрета подписи сервис не стартует
        authSettings_ = std::make_shared<adapters::secondary::AuthSettings>();
        hashPool_ = std::make_shared<WorkerPool>(
            authSettings_->getHashWorkers(),
            authSettings_->getHashQueueCapacity()
        );

        std::cout << "[CredentialApp] Environment loaded: pbkdf2 iterations="
                  << authSettings_->getPbkdf2Iterations()
                  << ", hash workers=" << hashPool_->threadCount() << std::endl;
    }

    void configureInjection() override {
        std::cout << "[CredentialApp] Configuring Boost.DI injection..." << std::endl;

        // ====================================================================
        // Boost.DI Injector Configuration
        // ====================================================================

        auto injector = di::make_injector(

            // ================================================================
            // Layer 1: Settings & Infrastructure
            // ================================================================
            di::bind<adapters::secondary::DbSettings>()
                .to(std::make_shared<adapters::secondary::DbSettings>()),

            di::bind<adapters::secondary::AuthSettings>()
                .to(authSettings_),

            di::bind<WorkerPool>()
                .to(hashPool_),

            di::bind<adapters::secondary::Pbkdf2PasswordHasher>()
                .to(std::make_shared<adapters::secondary::Pbkdf2PasswordHasher>(
                    authSettings_->getPbkdf2Iterations())),

            // ================================================================
            // Layer 2: Secondary Adapters (Output Ports implementations)
            // ================================================================

            di::bind<ports::output::IClock>()
                .to<adapters::secondary::SystemClock>()
                .in(di::singleton),

            di::bind<ports::output::IAccountRepository>()
                .to<adapters::secondary::PostgresAccountRepository>()
                .in(di::singleton),

            di::bind<ports::output::IPasswordHasher>()
                .to<adapters::secondary::PooledPasswordHasher>()
                .in(di::singleton),

            di::bind<ports::output::ITokenProvider>()
                .to<adapters::secondary::HmacJwtAdapter>()
                .in(di::singleton),

            // ================================================================
            // Layer 3: Application Services (Input Ports implementations)
            // ================================================================

            di::bind<ports::input::ICredentialService>()
                .to<application::CredentialService>()
                .in(di::singleton)
        );

        std::cout << "[CredentialApp] DI Injector configured:" << std::endl;
        std::cout << "  ✓ Secondary Adapters (4 bindings)" << std::endl;
        std::cout << "  ✓ Application Services (1 binding)" << std::endl;

        // ====================================================================
        // Layer 4: Primary Adapters (HTTP Handlers)
        // ====================================================================

        std::cout << "[CredentialApp] Registering HTTP Handlers via DI..." << std::endl;

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();
            registerEndpoint("GET", "/health", handler);
            std::cout << "  ✓ HealthHandler: GET /health" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::RegisterHandler>>();
            registerEndpoint("POST", "/api/v1/auth/register", handler);
            std::cout << "  ✓ RegisterHandler: POST /api/v1/auth/register" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::LoginHandler>>();
            registerEndpoint("POST", "/api/v1/auth/login", handler);
            std::cout << "  ✓ LoginHandler: POST /api/v1/auth/login" << std::endl;
        }

        // Защищённые маршруты: TokenAuthMiddleware -> handler
        auto tokenAuth = injector.create<std::shared_ptr<adapters::primary::TokenAuthMiddleware>>();

        {
            auto handler = std::make_shared<adapters::primary::ChainHandler>(
                tokenAuth,
                injector.create<std::shared_ptr<adapters::primary::ChangePasswordHandler>>()
            );
            registerEndpoint("POST", "/api/v1/auth/change-password", handler);
            std::cout << "  ✓ ChangePasswordHandler: POST /api/v1/auth/change-password" << std::endl;
        }

        {
            auto handler = std::make_shared<adapters::primary::ChainHandler>(
                tokenAuth,
                injector.create<std::shared_ptr<adapters::primary::ProfileHandler>>()
            );
            registerEndpoint("GET", "/api/v1/auth/profile", handler);
            std::cout << "  ✓ ProfileHandler: GET /api/v1/auth/profile" << std::endl;
        }

        std::cout << "[CredentialApp] Configuration complete! 5 handlers registered." << std::endl;
    }

private:
    std::shared_ptr<adapters::secondary::AuthSettings> authSettings_;
    std::shared_ptr<WorkerPool> hashPool_;
};

} // namespace credentials
