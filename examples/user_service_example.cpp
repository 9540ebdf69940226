#include <iostream>
#include <memory>
#include <string>

#include "weave/di/di.hpp"
#include "weave/log/logger.hpp"

using namespace weave::di;

class IUserRepository {
public:
    virtual ~IUserRepository() = default;
    virtual std::string find_user_by_id(int id) = 0;
    virtual void save_user(int id, const std::string& name) = 0;
};

class InMemoryUserRepository : public IUserRepository {
public:
    std::string find_user_by_id(int id) override {
        return "User_" + std::to_string(id);
    }

    void save_user(int id, const std::string& name) override {
        std::cout << "Saving user " << id << ": " << name << std::endl;
    }
};

// One per request: remembers who is calling
class RequestSession {
public:
    std::string user = "anonymous";
};

class UserService {
public:
    explicit UserService(DependencyContext& context)
        : repository_(context.get<IUserRepository>("user_repository")),
          session_(context.get<RequestSession>("session")) {}

    std::string get_user_info(int id) {
        return "Info: " + repository_->find_user_by_id(id) +
               " (requested by " + session_->user + ")";
    }

    void create_user(int id, const std::string& name) {
        repository_->save_user(id, name);
    }

private:
    std::shared_ptr<IUserRepository> repository_;
    std::shared_ptr<RequestSession> session_;
};

class UserController {
public:
    explicit UserController(DependencyContext& context)
        : user_service_(context.get<UserService>("user_service")) {}

    void handle_get_user(int id) {
        std::cout << "GET /users/" << id << " -> "
                  << user_service_->get_user_info(id) << std::endl;
    }

    void handle_create_user(int id, const std::string& name) {
        user_service_->create_user(id, name);
        std::cout << "POST /users/" << id << " created" << std::endl;
    }

private:
    std::shared_ptr<UserService> user_service_;
};

int main() {
    weave::log::LogConfig log_config;
    log_config.global_level = weave::log::LogConfig::LogLevel::DEBUG;
    weave::log::Logger::init(log_config);

    try {
        auto provider = create_provider([](ServiceRegistryBuilder& builder) {
            builder
                .add_singleton<IUserRepository, InMemoryUserRepository>(
                    "user_repository")
                .add_scoped<RequestSession>("session")
                .add_scoped<UserService>("user_service")
                .add_transient<UserController>("user_controller");
        });

        std::cout << "Registered services:";
        for (const auto& name : provider->registry().names()) {
            std::cout << " " << name;
        }
        std::cout << std::endl;

        for (const std::string user : {"alice", "bob"}) {
            auto scope = provider->begin_scope();
            scope->set_name("request:" + user);

            auto session = std::make_shared<RequestSession>();
            session->user = user;
            ExoticContext exotic;
            exotic.set_value("session", session);

            auto context = scope->create_context(exotic);
            auto first = context.get<UserController>("user_controller");
            auto second = context.get<UserController>("user_controller");

            first->handle_get_user(123);
            second->handle_create_user(456, "John Doe");

            std::cout << "Controller transient: "
                      << (first != second ? "PASS" : "FAIL") << std::endl;
        }

        std::cout << "Repository singletons created: "
                  << provider->singleton_count() << std::endl;
    } catch (const ResolveError& e) {
        WEAVE_LOG_ERROR << "Resolution failed: " << e.what();
        weave::log::Logger::shutdown();
        return 1;
    }

    weave::log::Logger::shutdown();
    return 0;
}
