#pragma once

#include "../helpers/Memory.hpp"

#include <expected>
#include <string>
#include <vector>

// Everything the wizard does to the machine. Implementations must be callable
// from a worker thread.
class IOnboardService {
  public:
    virtual ~IOnboardService() = default;

    virtual bool                                     checkNetwork()  = 0;
    virtual std::vector<std::string>                 listLocales()   = 0;
    virtual std::vector<std::string>                 listKeymaps()   = 0;
    virtual std::vector<std::string>                 listTimezones() = 0;

    virtual std::expected<void, std::string>         createUser(const std::string& username, const std::string& password, const std::vector<std::string>& groups,
                                                                const std::string& shell) = 0;
    virtual std::expected<void, std::string>         setLocale(const std::string& locale)     = 0;
    virtual std::expected<void, std::string>         setKeymap(const std::string& keymap)     = 0;
    virtual std::expected<void, std::string>         setTimezone(const std::string& timezone) = 0;

    // runs as `username` through a login shell, returns stdout
    virtual std::expected<std::string, std::string> runAsUser(const std::string& username, const std::vector<std::string>& cmd) = 0;
    // same, under sudo. The password goes to sudo's stdin.
    virtual std::expected<std::string, std::string> runAsUserWithSudo(const std::string& username, const std::vector<std::string>& cmd, const std::string& password) = 0;

    virtual std::expected<void, std::string>         removeInitialSession(const std::string& greetdConfig) = 0;
};

class CLiveService : public IOnboardService {
  public:
    bool                                     checkNetwork() override;
    std::vector<std::string>                 listLocales() override;
    std::vector<std::string>                 listKeymaps() override;
    std::vector<std::string>                 listTimezones() override;

    std::expected<void, std::string>         createUser(const std::string& username, const std::string& password, const std::vector<std::string>& groups,
                                                        const std::string& shell) override;
    std::expected<void, std::string>         setLocale(const std::string& locale) override;
    std::expected<void, std::string>         setKeymap(const std::string& keymap) override;
    std::expected<void, std::string>         setTimezone(const std::string& timezone) override;

    std::expected<std::string, std::string> runAsUser(const std::string& username, const std::vector<std::string>& cmd) override;
    std::expected<std::string, std::string> runAsUserWithSudo(const std::string& username, const std::vector<std::string>& cmd, const std::string& password) override;

    std::expected<void, std::string>         removeInitialSession(const std::string& greetdConfig) override;
};

// canned lists, every change succeeds without touching anything
class CDryrunService : public IOnboardService {
  public:
    bool                                     checkNetwork() override;
    std::vector<std::string>                 listLocales() override;
    std::vector<std::string>                 listKeymaps() override;
    std::vector<std::string>                 listTimezones() override;

    std::expected<void, std::string>         createUser(const std::string& username, const std::string& password, const std::vector<std::string>& groups,
                                                        const std::string& shell) override;
    std::expected<void, std::string>         setLocale(const std::string& locale) override;
    std::expected<void, std::string>         setKeymap(const std::string& keymap) override;
    std::expected<void, std::string>         setTimezone(const std::string& timezone) override;

    std::expected<std::string, std::string> runAsUser(const std::string& username, const std::vector<std::string>& cmd) override;
    std::expected<std::string, std::string> runAsUserWithSudo(const std::string& username, const std::vector<std::string>& cmd, const std::string& password) override;

    std::expected<void, std::string>         removeInitialSession(const std::string& greetdConfig) override;
};

UP<IOnboardService> makeOnboardService(bool dryrun);
