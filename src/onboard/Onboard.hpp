#pragma once

#include "Channel.hpp"
#include "Config.hpp"
#include "Messages.hpp"
#include "NetworkMonitor.hpp"
#include "Packages.hpp"
#include "Service.hpp"
#include "Simulation.hpp"
#include "Steps.hpp"
#include "TaskRunner.hpp"

#include "../helpers/Memory.hpp"
#include "../helpers/Message.hpp"
#include "../input/Key.hpp"
#include "../input/Modal.hpp"
#include "../input/TextBuffer.hpp"
#include "../system/Power.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

enum ePanelFocus : uint8_t {
    PANEL_WELCOME = 0,
    PANEL_SIDEBAR,
    PANEL_CONTENT,
};

enum eContentFocus : uint8_t {
    CONTENT_NONE = 0,
    CONTENT_PICKER,
    CONTENT_FIELD,
};

enum eConfirmAction : uint8_t {
    CONFIRM_REBOOT = 0,
    CONFIRM_POWEROFF,
    CONFIRM_CANCEL,
};

enum eUserField : uint8_t {
    USER_FIELD_USERNAME = 0,
    USER_FIELD_PASSWORD,
    USER_FIELD_CONFIRM,
};

// what the main loop has to do for us with the terminal handed over
struct SLaunchRequest {
    std::string              program;
    std::vector<std::string> args;
};

// The first boot wizard. Owns every piece of wizard state and is the only
// writer of it; background work reports back through the execution channel.
class COnboard {
  public:
    COnboard(SOnboardConfig config, UP<IOnboardService>&& service, UP<IPowerControl>&& power);
    ~COnboard() = default;

    COnboard(const COnboard&)            = delete;
    COnboard& operator=(const COnboard&) = delete;

    std::optional<SLaunchRequest>   handleKey(const SKeyEvent& key);

    // the 250ms clock: spinner, network probes, dry run progress
    void                            tick();

    // apply everything workers posted, in order
    void                            pumpMessages();
    void                            applyMessage(const SExecutionMessage& msg);

    // the network helper exited (or failed to start)
    void                            onExternalReturned(const std::expected<int, std::string>& result, const std::string& program);

    // joins the current worker. The ui never calls this, it polls wakeFd() instead.
    void                            waitIdle();

    int                             wakeFd() const;
    bool                            shouldExit() const;

    //
    const SOnboardConfig&           config() const;
    const CStepSequence&            steps() const;
    size_t                          selectedStep() const;
    ePanelFocus                     panel() const;
    eContentFocus                   contentFocus() const;
    eUserField                      userField() const;
    const CModalEditor&             editor() const;
    const CTextBuffer&              username() const;
    const CTextBuffer&              password() const;
    const CTextBuffer&              passwordConfirm() const;
    const CTextBuffer&              sudoPassword() const;
    const CTextBuffer&              pickerFilter() const;
    std::vector<std::string>        filteredPickerItems() const;
    size_t                          pickerSelected() const;
    const std::vector<STaskStatus>& tasks() const;
    std::optional<eStepId>          taskStep() const;
    bool                            executing() const;
    const std::optional<SStatusMessage>& message() const;
    std::optional<eConfirmAction>   confirmAction() const;
    bool                            showHelp() const;
    bool                            setupStarted() const;
    bool                            setupComplete() const;
    bool                            networkConnected() const;
    bool                            sudoNeeded() const;
    const CPackageSelection&        selection() const;
    const std::optional<std::string>& selectedLocale() const;
    const std::optional<std::string>& selectedKeyboard() const;
    const std::optional<std::string>& selectedTimezone() const;
    const std::optional<std::string>& createdUsername() const;
    char                            spinnerChar() const;
    bool                            dryrun() const;

  private:
    std::optional<SLaunchRequest> handleNormal(const SKeyEvent& key);
    std::optional<SLaunchRequest> handleInsert(const SKeyEvent& key);
    std::optional<SLaunchRequest> handleCommand(const SKeyEvent& key);
    void                          handleConfirm(const SKeyEvent& key, eConfirmAction action);
    std::optional<SLaunchRequest> handleEnter();
    std::optional<SLaunchRequest> runCommand(const std::string& text);

    void                          startSetup();
    void                          focusSidebar();
    void                          focusContent();
    void                          navigateDown();
    void                          navigateUp();
    void                          loadStepContent();
    void                          selectPickerItem();
    void                          advanceToNextStep();
    void                          skipCurrent();
    CTextBuffer*                  currentBuffer();

    bool                          validateUserForm(bool usernameOnly);
    void                          executeCurrent();
    void                          executeUser();
    void                          executeReview();
    void                          executeUpdate();
    void                          finishSetup();
    bool                          launchWorker(std::function<void()>&& job);

    void                          finishTaskList();
    size_t                        failedTaskCount() const;
    bool                          onStep(eStepId id) const;
    eStepId                       currentStepId() const;
    void                          setError(std::string text);
    void                          setInfo(std::string text);

    SOnboardConfig                m_config;
    UP<IOnboardService>           m_service;
    UP<IPowerControl>             m_power;

    CStepSequence                 m_steps;
    CPackageSelection             m_selection;
    CExecutionChannel             m_channel;
    CSimulationClock              m_simulation;
    CModalEditor                  m_editor{EDIT_MODE_NORMAL};

    ePanelFocus                   m_panel        = PANEL_WELCOME;
    eContentFocus                 m_contentFocus = CONTENT_NONE;
    eUserField                    m_userField    = USER_FIELD_USERNAME;
    size_t                        m_selected     = 0;

    std::vector<std::string>      m_pickerItems;
    size_t                        m_pickerSelected = 0;
    CTextBuffer                   m_pickerFilter;

    CTextBuffer                   m_username;
    CTextBuffer                   m_password        = CTextBuffer::makeMasked();
    CTextBuffer                   m_passwordConfirm = CTextBuffer::makeMasked();
    CTextBuffer                   m_sudoPassword    = CTextBuffer::makeMasked();

    std::vector<STaskStatus>      m_tasks;
    std::optional<eStepId>        m_taskStep;
    bool                          m_executing = false;

    std::optional<std::string>    m_selectedLocale, m_selectedKeyboard, m_selectedTimezone;
    std::optional<std::string>    m_createdUsername;

    std::optional<SStatusMessage> m_message;
    std::optional<eConfirmAction> m_confirm;
    bool                          m_showHelp      = false;
    bool                          m_shouldExit    = false;
    bool                          m_setupStarted  = false;
    bool                          m_setupComplete = false;
    uint8_t                       m_spinner       = 0;

    // both run threads that call into m_service, keep them below it
    CNetworkMonitor               m_network{*m_service};
    CTaskRunner                   m_runner;
};
