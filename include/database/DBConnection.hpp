#pragma once

#include <memory>
#include <string>
#include <pqxx/connection>

namespace cs::database {

class DBConnection {
  public:
    DBConnection();
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;

    void initPrepared() const;

  private:
    std::string DB_CONNECTION_STR;
    std::unique_ptr<pqxx::connection> conn_;

    void initPreparedWorkspaces() const;
    void initPreparedManifest() const;
    void initPreparedReservations() const;
};

} // namespace cs::database
