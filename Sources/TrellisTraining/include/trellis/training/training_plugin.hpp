#pragma once

#include <trellis/context.hpp>
#include <trellis/schema.hpp>
#include <optional>
#include <string>
#include <vector>

namespace trellis::training {

struct trainer {
    std::string name;
    std::string company_name;
    std::string address;
    std::string email;
    std::string phone;
};

struct client {
    std::string name;
};

struct exercise {
    std::string name;
};

/// One training appointment. Stored in the "session" table.
struct training_session {
    std::string date;
    row_id trainer;
    row_id client;
    std::optional<row_id> charge;
    std::vector<row_id> exercises;
};

/// Registers the trainer, client, exercise and session tables.
class training_plugin : public plugin {
public:
    void build(context& ctx) override;
};

} // namespace trellis::training

TRELLIS_TABLE(trellis::training::trainer, name, company_name, address, email, phone)
TRELLIS_TABLE(trellis::training::client, name)
TRELLIS_TABLE(trellis::training::exercise, name)
TRELLIS_TABLE(trellis::training::training_session, date, trainer, client, charge, exercises)
