#pragma once

#include <expected>
#include <string>

#include "SelectionProtocol.hpp"

#define XDPSR_DEFAULT_QUERY_TIMEOUT_MS 3000

// Anything that can answer "what did the user pick". The portal only talks to this.
class ISelectionSource {
  public:
    virtual ~ISelectionSource() = default;

    // the error string describes a transport failure, not a companion error
    virtual std::expected<SelectionReply, std::string> querySelection(const SSelectionQuery& query) = 0;
};

// Talks to the screen recorder over its unix socket. One connection per query.
class CSelectionClient : public ISelectionSource {
  public:
    CSelectionClient(const std::string& socketPath, int timeoutMs = XDPSR_DEFAULT_QUERY_TIMEOUT_MS);

    virtual std::expected<SelectionReply, std::string> querySelection(const SSelectionQuery& query);

  private:
    std::string m_szSocketPath;
    int         m_iTimeoutMs = XDPSR_DEFAULT_QUERY_TIMEOUT_MS;
};

// $XDG_RUNTIME_DIR/screen-recorder/picker.sock, or /tmp/screen-recorder-<uid>/picker.sock
std::string getDefaultSelectionSocketPath();
