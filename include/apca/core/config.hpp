#pragma once

#include <string>
#include <string_view>

namespace apca::core {

enum class EnvironmentKind {
    LiveTrading,
    PaperTrading,
    Custom
};

struct ClientEnvironment {
    EnvironmentKind kind{EnvironmentKind::PaperTrading};
    std::string trading_url;
    std::string market_data_url;
    std::string trading_stream_url;
    std::string market_data_stream_url;

    static ClientEnvironment Live();
    static ClientEnvironment Paper();
    static ClientEnvironment Custom(std::string trading, std::string market_data,
                                    std::string trading_stream, std::string market_data_stream);
};

class ClientConfig {
  public:
    ClientConfig() = default;

    static ClientConfig WithPaperKeys(std::string api_key, std::string api_secret);
    static ClientConfig WithLiveKeys(std::string api_key, std::string api_secret);

    /**
     * Builds a configuration from APCA_API_KEY_ID and APCA_API_SECRET_KEY.
     * APCA_PAPER=false (or 0) selects the live environment and APCA_TRADING_URL
     * overrides the trading REST base URL. Throws std::invalid_argument when the
     * credentials are not set.
     */
    static ClientConfig FromEnvironment();

    ClientConfig& set_environment(ClientEnvironment env);
    ClientConfig& set_credentials(std::string api_key, std::string api_secret);

    [[nodiscard]] const ClientEnvironment& environment() const noexcept;
    [[nodiscard]] std::string_view api_key() const noexcept;
    [[nodiscard]] std::string_view api_secret() const noexcept;
    [[nodiscard]] bool is_live() const noexcept;

  private:
    ClientEnvironment environment_{ClientEnvironment::Paper()};
    std::string api_key_;
    std::string api_secret_;
};

}  // namespace apca::core
