#include <iostream>
#include <memory>
#include <thread>
#include <vector>
#include <utility>
#include <boost/asio.hpp>
#include "common/config/config.hpp"
#include "common/connection_pool/sqlite_connection_pool.hpp"
#include "common/restful/http_server.hpp"
#include "infrastructure/sqlite_contact_repository.hpp"
#include "application/contact_service.hpp"
#include "interface/rest_api_handler.hpp"

int main() {
  try {
    const auto& cfg = config::Config::getInstance();
    const auto& service_config = cfg.getContactService();

    // 初始化存储层
    auto pool = std::make_shared<common::SqliteConnectionPool>(cfg.getDBCntPool(), cfg.getDatabase());
    auto repository = std::make_shared<contact_service::SqliteContactRepository>(pool);

    auto schema = repository->ensureSchema();
    if (!schema) {
      std::cerr << "Error: failed to prepare database " << cfg.getDatabase().path
                << ": " << schema.error().message << std::endl;
      return 1;
    }

    auto service = std::make_shared<contact_service::ContactService>(repository);

    // 启动REST API服务器
    const int threads = service_config.threads > 0 ? service_config.threads : 1;
    boost::asio::io_context ioc{threads};

    auto http_endpoint = boost::asio::ip::tcp::endpoint{
      boost::asio::ip::make_address(service_config.host),
      static_cast<unsigned short>(service_config.port)
    };

    auto api_handler = std::make_shared<contact_service::RestApiHandler>(
      service, cfg.getCors().allowed_origin);
    common::HttpServer http_server{ioc, http_endpoint, api_handler};

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
      if (ec) return;
      std::cout << "Received signal " << signal_number << ", shutting down" << std::endl;
      http_server.stop();
      ioc.stop();
    });

    std::cout << "HTTP Server listening on " << cfg.getContactServiceIpPort()
              << " (database: " << cfg.getDatabase().path << ")" << std::endl;

    http_server.run();

    std::vector<std::thread> workers;
    workers.reserve(threads - 1);
    for (int i = 1; i < threads; ++i) {
      workers.emplace_back([&ioc]() { ioc.run(); });
    }
    // 主线程也参与处理请求
    ioc.run();

    for (auto& worker : workers) {
      worker.join();
    }

    pool->shutdown();
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
