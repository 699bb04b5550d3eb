#include "Onboard.hpp"

#include "../helpers/Logger.hpp"
#include "../helpers/Text.hpp"
#include "../input/Command.hpp"

#include <hyprutils/string/String.hpp>

#include <openssl/crypto.h>

#include <algorithm>
#include <format>

// a secret handed to a worker. Filled in place, wiped by the last owner.
struct SWorkerSecret {
    std::string value;

    ~SWorkerSecret() {
        OPENSSL_cleanse(value.data(), value.size());
    }
};

static SP<SWorkerSecret> takeSecret(const CTextBuffer& buf) {
    auto secret = makeShared<SWorkerSecret>();
    secret->value.assign(buf.content());
    return secret;
}

static bool validUsernameChars(std::string_view username) {
    return std::ranges::all_of(username, [](char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-'; });
}

static STaskStatus makeTask(std::string name, bool simulated) {
    return STaskStatus{.name = std::move(name), .state = TASK_PENDING, .progress = simulated ? std::optional<uint8_t>{0} : std::nullopt};
}

COnboard::COnboard(SOnboardConfig config, UP<IOnboardService>&& service, UP<IPowerControl>&& power) :
    m_config(std::move(config)), m_service(std::move(service)), m_power(std::move(power)), m_steps(m_config), m_selection(m_config.updates) {

    if (!m_channel.good())
        g_logger->log(LOG_ERR, "onboard: execution channel has no wake pipe, results only show on the next tick");

    if (m_steps.indexOf(STEP_NETWORK))
        m_network.probeNow();

    g_logger->log(LOG_DEBUG, "onboard: {} steps, dryrun {}", m_steps.size(), dryrun());
}

std::optional<SLaunchRequest> COnboard::handleKey(const SKeyEvent& key) {
    if (m_message && !m_executing)
        m_message.reset();

    if (m_confirm) {
        handleConfirm(key, *m_confirm);
        return std::nullopt;
    }

    if (m_showHelp) {
        if (key.code == INPUT_KEY_ESCAPE || key.isChar('q') || key.isChar('?') || key.isFunction(1))
            m_showHelp = false;
        return std::nullopt;
    }

    switch (m_editor.mode()) {
        case EDIT_MODE_NORMAL: return handleNormal(key);
        case EDIT_MODE_INSERT: return handleInsert(key);
        case EDIT_MODE_COMMAND: return handleCommand(key);
    }

    return std::nullopt;
}

std::optional<SLaunchRequest> COnboard::handleNormal(const SKeyEvent& key) {
    if (key.isCtrl('h')) {
        focusSidebar();
        return std::nullopt;
    }

    if (key.isCtrl('l')) {
        focusContent();
        return std::nullopt;
    }

    // field edits: x 0 $ dd
    if (m_panel == PANEL_CONTENT && m_contentFocus == CONTENT_FIELD) {
        const bool EDIT = key.isChar('x') || key.isChar('0') || key.isChar('$') || key.isChar('d') || key.code == INPUT_KEY_DELETE || key.code == INPUT_KEY_HOME ||
            key.code == INPUT_KEY_END;

        if (auto* buf = currentBuffer(); buf && EDIT) {
            m_editor.feedNormal(*buf, key);
            return std::nullopt;
        }
    }

    m_editor.resetPending();

    if (key.isChar(':')) {
        m_editor.enterCommand();
        return std::nullopt;
    }

    if (key.isChar('j') || key.code == INPUT_KEY_DOWN || key.code == INPUT_KEY_TAB) {
        navigateDown();
        return std::nullopt;
    }

    if (key.isChar('k') || key.code == INPUT_KEY_UP || key.code == INPUT_KEY_BACKTAB) {
        navigateUp();
        return std::nullopt;
    }

    if (key.isChar('i') || key.isChar('a')) {
        if (m_panel == PANEL_CONTENT && m_contentFocus != CONTENT_NONE)
            m_editor.apply(MODE_ACTION_ENTER_INSERT);
        return std::nullopt;
    }

    if (key.code == INPUT_KEY_ENTER)
        return handleEnter();

    if (key.isChar('l') || key.code == INPUT_KEY_RIGHT) {
        if (m_panel == PANEL_SIDEBAR) {
            focusContent();
            return std::nullopt;
        }
        return handleEnter();
    }

    if (key.isChar('h') || key.code == INPUT_KEY_LEFT || key.code == INPUT_KEY_ESCAPE) {
        if (m_panel == PANEL_CONTENT)
            focusSidebar();
        return std::nullopt;
    }

    if (key.isChar('?') || key.isFunction(1)) {
        m_showHelp = true;
        return std::nullopt;
    }

    if (key.isFunction(12)) {
        m_confirm = CONFIRM_POWEROFF;
        return std::nullopt;
    }

    if (!key.isPrintable())
        return std::nullopt;

    if (key.ch >= '1' && key.ch <= '9') {
        const size_t N = key.ch - '0';
        if (m_setupStarted && m_panel == PANEL_SIDEBAR && N <= m_steps.size()) {
            m_selected = N - 1;
            loadStepContent();
        }
        return std::nullopt;
    }

    if (key.isChar(' ')) {
        if (m_panel == PANEL_CONTENT && onStep(STEP_UPDATE) && !m_executing)
            m_selection.toggleAtCursor();
        return std::nullopt;
    }

    // typing on a picker starts filtering
    if (m_panel == PANEL_CONTENT && m_contentFocus == CONTENT_PICKER) {
        m_editor.apply(MODE_ACTION_ENTER_INSERT);
        m_pickerFilter.insert(key.ch);
        m_pickerSelected = 0;
    }

    return std::nullopt;
}

std::optional<SLaunchRequest> COnboard::handleInsert(const SKeyEvent& key) {
    if (key.code == INPUT_KEY_ESCAPE) {
        m_editor.apply(MODE_ACTION_CANCEL);
        return std::nullopt;
    }

    if (key.isCtrl('h')) {
        m_editor.setMode(EDIT_MODE_NORMAL);
        focusSidebar();
        return std::nullopt;
    }

    if (key.code == INPUT_KEY_ENTER) {
        m_editor.setMode(EDIT_MODE_NORMAL);

        if (m_contentFocus == CONTENT_PICKER) {
            selectPickerItem();
            return std::nullopt;
        }

        if (m_contentFocus != CONTENT_FIELD)
            return std::nullopt;

        if (onStep(STEP_USER)) {
            if (m_userField == USER_FIELD_CONFIRM) {
                executeUser();
                return std::nullopt;
            }
            m_userField = sc<eUserField>(m_userField + 1);
            m_editor.setMode(EDIT_MODE_INSERT);
        } else if (onStep(STEP_UPDATE) && !m_sudoPassword.empty())
            executeUpdate();

        return std::nullopt;
    }

    if (key.code == INPUT_KEY_TAB || key.code == INPUT_KEY_BACKTAB) {
        if (m_contentFocus == CONTENT_FIELD && onStep(STEP_USER)) {
            if (key.code == INPUT_KEY_TAB && m_userField < USER_FIELD_CONFIRM)
                m_userField = sc<eUserField>(m_userField + 1);
            else if (key.code == INPUT_KEY_BACKTAB && m_userField > USER_FIELD_USERNAME)
                m_userField = sc<eUserField>(m_userField - 1);
        }
        return std::nullopt;
    }

    if (m_contentFocus == CONTENT_PICKER && (key.code == INPUT_KEY_DOWN || key.code == INPUT_KEY_UP)) {
        if (key.code == INPUT_KEY_DOWN)
            navigateDown();
        else
            navigateUp();
        return std::nullopt;
    }

    auto* buf = currentBuffer();
    if (!buf)
        return std::nullopt;

    const auto BEFORE = buf->len();
    if (m_editor.feedInsert(*buf, key) && buf == &m_pickerFilter && buf->len() != BEFORE)
        m_pickerSelected = 0;

    return std::nullopt;
}

std::optional<SLaunchRequest> COnboard::handleCommand(const SKeyEvent& key) {
    const auto FEED = m_editor.feedCommand(key);

    if (!FEED.executed)
        return std::nullopt;

    return runCommand(*FEED.executed);
}

void COnboard::handleConfirm(const SKeyEvent& key, eConfirmAction action) {
    if (key.isChar('n') || key.isChar('N') || key.code == INPUT_KEY_ESCAPE) {
        m_confirm.reset();
        return;
    }

    if (!key.isChar('y') && !key.isChar('Y') && key.code != INPUT_KEY_ENTER)
        return;

    m_confirm.reset();

    if (action == CONFIRM_CANCEL) {
        g_logger->log(LOG_DEBUG, "onboard: cancelled by the user");
        m_shouldExit = true;
        return;
    }

    // a finished dry run ends here instead of powering anything off
    if (dryrun() && m_setupComplete) {
        setInfo("Setup complete!");
        m_shouldExit = true;
        return;
    }

    const auto RESULT = action == CONFIRM_REBOOT ? m_power->reboot() : m_power->poweroff();
    if (!RESULT)
        setError(std::format("{} failed: {}", action == CONFIRM_REBOOT ? "Reboot" : "Poweroff", RESULT.error()));
}

std::optional<SLaunchRequest> COnboard::handleEnter() {
    if (m_panel == PANEL_WELCOME) {
        startSetup();
        return std::nullopt;
    }

    if (m_steps.isLocked(m_selected)) {
        setError("This step is locked. Complete previous steps first.");
        return std::nullopt;
    }

    if (m_panel == PANEL_SIDEBAR) {
        focusContent();
        if (m_contentFocus == CONTENT_FIELD)
            m_editor.setMode(EDIT_MODE_INSERT);
        return std::nullopt;
    }

    // the dry run never asks for the sudo password
    if (onStep(STEP_UPDATE) && dryrun()) {
        executeUpdate();
        return std::nullopt;
    }

    switch (m_contentFocus) {
        case CONTENT_PICKER: selectPickerItem(); return std::nullopt;
        case CONTENT_FIELD:
            if (onStep(STEP_UPDATE) && !m_sudoPassword.empty())
                executeUpdate();
            else
                m_editor.setMode(EDIT_MODE_INSERT);
            return std::nullopt;
        case CONTENT_NONE: break;
    }

    switch (currentStepId()) {
        case STEP_NETWORK:
            if (!m_network.connected())
                return SLaunchRequest{.program = m_config.network.program, .args = m_config.network.args};

            m_steps.setResult(m_selected, STEP_RESULT_COMPLETED);
            advanceToNextStep();
            break;
        case STEP_REVIEW: executeReview(); break;
        case STEP_UPDATE: executeUpdate(); break;
        case STEP_REBOOT: finishSetup(); break;
        default: break;
    }

    return std::nullopt;
}

std::optional<SLaunchRequest> COnboard::runCommand(const std::string& text) {
    const auto CMD = Command::parseWizard(text);
    if (!CMD) {
        setError(CMD.error());
        return std::nullopt;
    }

    switch (*CMD) {
        case WIZARD_COMMAND_START:
            if (!m_setupStarted)
                startSetup();
            break;
        case WIZARD_COMMAND_NEXT:
            if (m_setupStarted)
                advanceToNextStep();
            break;
        case WIZARD_COMMAND_SKIP: skipCurrent(); break;
        case WIZARD_COMMAND_CANCEL: m_confirm = CONFIRM_CANCEL; break;
        case WIZARD_COMMAND_REBOOT: m_confirm = CONFIRM_REBOOT; break;
        case WIZARD_COMMAND_POWEROFF: m_confirm = CONFIRM_POWEROFF; break;
        case WIZARD_COMMAND_HELP: m_showHelp = true; break;
        case WIZARD_COMMAND_SUBMIT: executeCurrent(); break;
        case WIZARD_COMMAND_FINISH: {
            const auto REVIEW = m_steps.indexOf(STEP_REVIEW);
            if (!REVIEW || m_steps.result(*REVIEW) != STEP_RESULT_COMPLETED) {
                setError("Complete the Review step first");
                break;
            }
            finishSetup();
            break;
        }
    }

    return std::nullopt;
}

void COnboard::startSetup() {
    m_setupStarted = true;
    m_selected     = 0;
    loadStepContent();

    if (m_config.network.skipIfConnected && m_network.connected()) {
        if (const auto IDX = m_steps.indexOf(STEP_NETWORK); IDX)
            m_steps.setResult(*IDX, STEP_RESULT_COMPLETED);
    }

    focusContent();
    if (m_contentFocus == CONTENT_FIELD)
        m_editor.setMode(EDIT_MODE_INSERT);
}

void COnboard::focusSidebar() {
    if (!m_setupStarted || m_setupComplete)
        return;

    m_panel        = PANEL_SIDEBAR;
    m_contentFocus = CONTENT_NONE;
    m_editor.setMode(EDIT_MODE_NORMAL);
}

void COnboard::focusContent() {
    if (!m_setupStarted || m_setupComplete)
        return;

    if (m_steps.isLocked(m_selected)) {
        focusSidebar();
        setError("This step is locked. Complete previous steps first.");
        return;
    }

    m_panel = PANEL_CONTENT;

    const auto& ITEM = m_steps.item(m_selected);

    if (ITEM.hasPicker) {
        m_contentFocus = CONTENT_PICKER;
        m_editor.setMode(EDIT_MODE_INSERT);
    } else if (ITEM.id == STEP_UPDATE)
        m_contentFocus = sudoNeeded() ? CONTENT_FIELD : CONTENT_NONE;
    else if (ITEM.hasForm) {
        m_contentFocus = CONTENT_FIELD;
        m_userField    = USER_FIELD_USERNAME;
    } else
        m_contentFocus = CONTENT_NONE;
}

void COnboard::navigateDown() {
    switch (m_panel) {
        case PANEL_WELCOME: break;
        case PANEL_SIDEBAR:
            if (m_selected + 1 < m_steps.size()) {
                m_selected++;
                loadStepContent();
            }
            break;
        case PANEL_CONTENT:
            if (onStep(STEP_UPDATE) && !m_executing) {
                m_selection.moveDown();
                break;
            }

            if (m_contentFocus == CONTENT_PICKER) {
                if (m_pickerSelected + 1 < filteredPickerItems().size())
                    m_pickerSelected++;
            } else if (m_contentFocus == CONTENT_FIELD && onStep(STEP_USER) && m_userField < USER_FIELD_CONFIRM)
                m_userField = sc<eUserField>(m_userField + 1);
            break;
    }
}

void COnboard::navigateUp() {
    switch (m_panel) {
        case PANEL_WELCOME: break;
        case PANEL_SIDEBAR:
            if (m_selected > 0) {
                m_selected--;
                loadStepContent();
            }
            break;
        case PANEL_CONTENT:
            if (onStep(STEP_UPDATE) && !m_executing) {
                m_selection.moveUp();
                break;
            }

            if (m_contentFocus == CONTENT_PICKER) {
                if (m_pickerSelected > 0)
                    m_pickerSelected--;
            } else if (m_contentFocus == CONTENT_FIELD && onStep(STEP_USER) && m_userField > USER_FIELD_USERNAME)
                m_userField = sc<eUserField>(m_userField - 1);
            break;
    }
}

void COnboard::loadStepContent() {
    std::vector<std::string> const* configured = nullptr;
    const std::string*              preferred  = nullptr;

    switch (currentStepId()) {
        case STEP_LOCALE:
            configured = &m_config.locale.available;
            preferred  = &m_config.locale.defaultLocale;
            break;
        case STEP_KEYBOARD:
            configured = &m_config.keyboard.available;
            preferred  = &m_config.keyboard.defaultLayout;
            break;
        case STEP_PREFERENCES:
            configured = &m_config.preferences.available;
            preferred  = &m_config.preferences.defaultTimezone;
            break;
        case STEP_UPDATE: m_sudoPassword.clear(); return;
        default: return;
    }

    if (!configured->empty())
        m_pickerItems = *configured;
    else if (onStep(STEP_LOCALE))
        m_pickerItems = m_service->listLocales();
    else if (onStep(STEP_KEYBOARD))
        m_pickerItems = m_service->listKeymaps();
    else
        m_pickerItems = m_service->listTimezones();

    m_pickerFilter.clear();

    const auto IT    = std::ranges::find(m_pickerItems, *preferred);
    m_pickerSelected = IT == m_pickerItems.end() ? 0 : sc<size_t>(IT - m_pickerItems.begin());
}

void COnboard::selectPickerItem() {
    const auto ITEMS = filteredPickerItems();
    if (m_pickerSelected >= ITEMS.size())
        return;

    const auto& VALUE = ITEMS[m_pickerSelected];

    switch (currentStepId()) {
        case STEP_LOCALE:
            m_selectedLocale = VALUE;
            setInfo(std::format("Locale selected: {}", VALUE));
            break;
        case STEP_KEYBOARD:
            m_selectedKeyboard = VALUE;
            setInfo(std::format("Keyboard selected: {}", VALUE));
            break;
        case STEP_PREFERENCES:
            m_selectedTimezone = VALUE;
            setInfo(std::format("Timezone selected: {}", VALUE));
            break;
        default: return;
    }

    m_steps.setResult(m_selected, STEP_RESULT_COMPLETED);
    advanceToNextStep();
}

void COnboard::advanceToNextStep() {
    if (m_selected + 1 < m_steps.size()) {
        m_selected++;
        loadStepContent();
    }

    focusContent();
}

void COnboard::skipCurrent() {
    if (!m_setupStarted)
        return;

    const auto& ITEM = m_steps.item(m_selected);

    if (ITEM.required) {
        setError("This step is required");
        return;
    }

    if (m_executing && m_taskStep == ITEM.id) {
        setError("This step is still running");
        return;
    }

    if (!m_steps.setResult(m_selected, STEP_RESULT_SKIPPED)) {
        setError("This step is locked. Complete previous steps first.");
        return;
    }

    if (ITEM.id == STEP_UPDATE)
        m_steps.onUpdateFinished();

    advanceToNextStep();
}

CTextBuffer* COnboard::currentBuffer() {
    if (m_contentFocus == CONTENT_PICKER)
        return &m_pickerFilter;

    if (m_contentFocus != CONTENT_FIELD)
        return nullptr;

    if (onStep(STEP_UPDATE))
        return &m_sudoPassword;

    if (!onStep(STEP_USER))
        return nullptr;

    switch (m_userField) {
        case USER_FIELD_USERNAME: return &m_username;
        case USER_FIELD_PASSWORD: return &m_password;
        case USER_FIELD_CONFIRM: return &m_passwordConfirm;
    }

    return nullptr;
}

bool COnboard::validateUserForm(bool usernameOnly) {
    const auto USERNAME = m_username.content();

    if (USERNAME.empty()) {
        setError("Username is required");
        return false;
    }

    if (!validUsernameChars(USERNAME)) {
        setError("Username can only contain letters, numbers, underscore, and dash");
        return false;
    }

    if (USERNAME.size() > 32) {
        setError("Username must be 32 characters or less");
        return false;
    }

    if (usernameOnly)
        return true;

    if (m_password.empty()) {
        setError("Password is required");
        return false;
    }

    if (m_password.len() < m_config.user.minPasswordLength) {
        setError(std::format("Password must be at least {} characters", m_config.user.minPasswordLength));
        return false;
    }

    if (m_password.content() != m_passwordConfirm.content()) {
        setError("Passwords do not match");
        return false;
    }

    return true;
}

bool COnboard::launchWorker(std::function<void()>&& job) {
    if (auto ret = m_runner.launch(std::move(job)); !ret) {
        m_executing = false;
        for (auto& t : m_tasks) {
            if (t.state == TASK_PENDING || t.state == TASK_RUNNING) {
                t.state  = TASK_FAILED;
                t.output = ret.error();
            }
        }
        setError(ret.error());
        return false;
    }

    return true;
}

void COnboard::executeCurrent() {
    if (!m_setupStarted)
        return;

    switch (currentStepId()) {
        case STEP_USER: executeUser(); break;
        case STEP_REVIEW: executeReview(); break;
        case STEP_UPDATE: executeUpdate(); break;
        case STEP_REBOOT: finishSetup(); break;
        default: setError("Nothing to submit on this step"); break;
    }
}

void COnboard::executeUser() {
    if (m_executing) {
        setError("Another operation is still running");
        return;
    }

    if (!validateUserForm(false))
        return;

    const auto USERNAME = std::string{m_username.content()};
    auto       secret   = takeSecret(m_password);
    m_password.clear();
    m_passwordConfirm.clear();

    m_tasks = {makeTask(std::format("Creating user '{}'", USERNAME), false)};
    m_tasks.front().state = TASK_RUNNING;
    m_taskStep            = STEP_USER;
    m_executing           = true;

    g_logger->log(LOG_DEBUG, "onboard: creating user {}", USERNAME);

    launchWorker([service = m_service.get(), channel = &m_channel, secret = std::move(secret), username = USERNAME, groups = m_config.user.groups,
                  shell = m_config.user.shell]() {
        const auto RESULT = service->createUser(username, secret->value, groups, shell);

        if (RESULT) {
            channel->post(STaskSucceeded{.idx = 0});
            channel->post(SUserCreated{.username = username});
            channel->post(SStepComplete{.result = STEP_RESULT_COMPLETED});
            return;
        }

        channel->post(STaskFailed{.idx = 0, .error = RESULT.error()});
        channel->post(SUserCreated{});
        channel->post(SStepComplete{.result = STEP_RESULT_FAILED});
    });
}

void COnboard::executeReview() {
    if (m_executing) {
        setError("Another operation is still running");
        return;
    }

    const auto USERNAME        = std::string{m_username.content()};
    const bool ALREADY_CREATED = m_createdUsername && *m_createdUsername == USERNAME;

    if (!validateUserForm(ALREADY_CREATED))
        return;

    const bool SIMULATED = dryrun();

    m_tasks = {makeTask(std::format("Creating user '{}'", USERNAME), SIMULATED)};
    if (m_selectedLocale)
        m_tasks.emplace_back(makeTask(std::format("Setting locale to {}", *m_selectedLocale), SIMULATED));
    if (m_selectedKeyboard)
        m_tasks.emplace_back(makeTask(std::format("Setting keyboard to {}", *m_selectedKeyboard), SIMULATED));
    if (m_selectedTimezone)
        m_tasks.emplace_back(makeTask(std::format("Setting timezone to {}", *m_selectedTimezone), SIMULATED));

    m_taskStep  = STEP_REVIEW;
    m_executing = true;

    auto secret = ALREADY_CREATED ? SP<SWorkerSecret>{} : takeSecret(m_password);
    m_password.clear();
    m_passwordConfirm.clear();

    if (SIMULATED) {
        m_createdUsername = USERNAME;
        m_simulation.start(SIMULATION_REVIEW);
        return;
    }

    launchWorker([service = m_service.get(), channel = &m_channel, secret = std::move(secret), username = USERNAME, groups = m_config.user.groups,
                  shell = m_config.user.shell, locale = m_selectedLocale, keymap = m_selectedKeyboard, timezone = m_selectedTimezone]() {
        bool   anyFailed = false;
        size_t idx       = 0;

        const auto report = [&](const std::expected<void, std::string>& result) {
            if (result)
                channel->post(STaskSucceeded{.idx = idx});
            else {
                anyFailed = true;
                channel->post(STaskFailed{.idx = idx, .error = result.error()});
            }
            idx++;
        };

        channel->post(STaskStarted{.idx = idx});
        if (!secret) {
            channel->post(STaskSucceeded{.idx = idx, .output = "already created"});
            idx++;
        } else {
            const auto RESULT = service->createUser(username, secret->value, groups, shell);
            report(RESULT);
            channel->post(SUserCreated{.username = RESULT ? std::optional<std::string>{username} : std::nullopt});
        }

        if (locale) {
            channel->post(STaskStarted{.idx = idx});
            report(service->setLocale(*locale));
        }

        if (keymap) {
            channel->post(STaskStarted{.idx = idx});
            report(service->setKeymap(*keymap));
        }

        if (timezone) {
            channel->post(STaskStarted{.idx = idx});
            report(service->setTimezone(*timezone));
        }

        channel->post(SReviewComplete{.anyFailed = anyFailed});
    });
}

void COnboard::executeUpdate() {
    if (m_executing) {
        setError("Another operation is still running");
        return;
    }

    const auto IDX = m_steps.indexOf(STEP_UPDATE);
    if (!IDX || m_steps.isLocked(*IDX)) {
        setError("This step is locked. Complete previous steps first.");
        return;
    }

    auto commands = m_selection.selectedCommands();

    if (commands.empty()) {
        m_steps.setResult(*IDX, STEP_RESULT_SKIPPED);
        m_steps.onUpdateFinished();
        setInfo("No packages selected. Continuing to finish.");
        if (onStep(STEP_UPDATE))
            advanceToNextStep();
        return;
    }

    if (dryrun()) {
        m_tasks.clear();
        for (const auto& c : commands) {
            m_tasks.emplace_back(makeTask(c.name, true));
        }
        m_taskStep  = STEP_UPDATE;
        m_executing = true;
        m_simulation.start(SIMULATION_UPDATE);
        return;
    }

    if (!m_createdUsername) {
        setError("User must be created before running commands");
        return;
    }

    const bool SUDO = m_selection.needsSudo();

    if (SUDO && m_sudoPassword.empty()) {
        setError("Enter your password for sudo commands");
        if (onStep(STEP_UPDATE)) {
            m_panel        = PANEL_CONTENT;
            m_contentFocus = CONTENT_FIELD;
            m_editor.setMode(EDIT_MODE_INSERT);
        }
        return;
    }

    auto secret = SUDO ? takeSecret(m_sudoPassword) : SP<SWorkerSecret>{};
    m_sudoPassword.clear();

    m_tasks.clear();
    for (const auto& c : commands) {
        m_tasks.emplace_back(makeTask(c.name, false));
    }
    m_taskStep     = STEP_UPDATE;
    m_executing    = true;
    m_contentFocus = CONTENT_NONE;
    m_editor.setMode(EDIT_MODE_NORMAL);

    g_logger->log(LOG_DEBUG, "onboard: running {} update commands as {}", commands.size(), *m_createdUsername);

    launchWorker([service = m_service.get(), channel = &m_channel, secret = std::move(secret), username = *m_createdUsername, commands = std::move(commands)]() {
        bool anyFailed = false;

        for (size_t i = 0; i < commands.size(); ++i) {
            const auto& CMD = commands[i];

            channel->post(STaskStarted{.idx = i});

            const auto RESULT = CMD.sudo && secret ? service->runAsUserWithSudo(username, CMD.command, secret->value) : service->runAsUser(username, CMD.command);

            if (!RESULT) {
                anyFailed = true;
                channel->post(STaskFailed{.idx = i, .error = RESULT.error()});
                continue;
            }

            auto output = Hyprutils::String::trim(*RESULT);
            channel->post(STaskSucceeded{.idx = i, .output = output.empty() ? std::nullopt : std::optional<std::string>{std::move(output)}});
        }

        channel->post(SUpdateComplete{.anyFailed = anyFailed});
    });
}

void COnboard::finishSetup() {
    if (m_executing) {
        setError("Another operation is still running");
        return;
    }

    const auto IDX = m_steps.indexOf(STEP_REBOOT);
    if (IDX && m_steps.isLocked(*IDX)) {
        setError("This step is locked. Complete previous steps first.");
        return;
    }

    m_tasks    = {makeTask("Finishing setup", false)};
    m_taskStep = STEP_REBOOT;

    auto& task = m_tasks.front();
    task.state = TASK_SUCCESS;

    if (m_config.completion.removeInitialSession) {
        if (const auto RET = m_service->removeInitialSession(m_config.completion.greetdConfig); !RET) {
            g_logger->log(LOG_WARN, "onboard: failed to remove initial session: {}", RET.error());
            task.state  = TASK_FAILED;
            task.output = RET.error();
            setError(std::format("Failed to remove initial session: {}", RET.error()));
        }
    }

    if (IDX)
        m_steps.setResult(*IDX, STEP_RESULT_COMPLETED);

    m_setupComplete = true;
    m_editor.setMode(EDIT_MODE_NORMAL);

    g_logger->log(LOG_DEBUG, "onboard: setup finished, completion action {}", m_config.completion.action);

    if (dryrun() || m_config.completion.action == "reboot")
        m_confirm = CONFIRM_REBOOT;
    else if (m_config.completion.action == "poweroff")
        m_confirm = CONFIRM_POWEROFF;
    else
        m_shouldExit = true;
}

void COnboard::tick() {
    m_spinner = (m_spinner + 1) % 4;

    if (m_spinner == 0 && m_steps.indexOf(STEP_NETWORK))
        m_network.probeAsync();

    if (!m_simulation.active())
        return;

    const auto DONE = m_simulation.tick(m_tasks);
    if (!DONE)
        return;

    switch (*DONE) {
        case SIMULATION_REVIEW: applyMessage(SReviewComplete{}); break;
        case SIMULATION_UPDATE: applyMessage(SUpdateComplete{}); break;
    }
}

void COnboard::pumpMessages() {
    for (const auto& msg : m_channel.drain()) {
        applyMessage(msg);
    }
}

void COnboard::applyMessage(const SExecutionMessage& msg) {
    std::visit(
        [this](const auto& m) {
            using T = std::decay_t<decltype(m)>;

            if constexpr (std::is_same_v<T, STaskStarted>) {
                if (m.idx < m_tasks.size())
                    m_tasks[m.idx].state = TASK_RUNNING;
            } else if constexpr (std::is_same_v<T, STaskSucceeded>) {
                if (m.idx < m_tasks.size()) {
                    m_tasks[m.idx].state  = TASK_SUCCESS;
                    m_tasks[m.idx].output = m.output;
                }
            } else if constexpr (std::is_same_v<T, STaskFailed>) {
                if (m.idx < m_tasks.size()) {
                    m_tasks[m.idx].state  = TASK_FAILED;
                    m_tasks[m.idx].output = m.error;
                }
                g_logger->log(LOG_WARN, "onboard: task {} failed: {}", m.idx, m.error);
                setError(m.error);
            } else if constexpr (std::is_same_v<T, SUserCreated>) {
                if (m.username)
                    m_createdUsername = m.username;
            } else if constexpr (std::is_same_v<T, SStepComplete>) {
                finishTaskList();
                m_steps.setResult(*m_steps.indexOf(STEP_USER), m.result);
                if (m.result == STEP_RESULT_COMPLETED && onStep(STEP_USER))
                    advanceToNextStep();
            } else if constexpr (std::is_same_v<T, SReviewComplete>) {
                finishTaskList();

                const auto IDX = *m_steps.indexOf(STEP_REVIEW);

                if (m.anyFailed) {
                    m_steps.setResult(IDX, STEP_RESULT_FAILED);
                    setError(std::format("{} task(s) failed during configuration", failedTaskCount()));
                    return;
                }

                m_steps.setResult(IDX, STEP_RESULT_COMPLETED);
                m_steps.onReviewCompleted();
                setInfo(m_steps.indexOf(STEP_UPDATE) ? "Configuration applied! Select packages to install." : "Configuration applied!");
                if (onStep(STEP_REVIEW))
                    advanceToNextStep();
            } else if constexpr (std::is_same_v<T, SUpdateComplete>) {
                finishTaskList();

                const auto IDX = m_steps.indexOf(STEP_UPDATE);
                if (!IDX)
                    return;

                if (m.anyFailed) {
                    m_steps.setResult(*IDX, STEP_RESULT_FAILED);
                    setError(std::format("{} task(s) failed during configuration", failedTaskCount()));
                    return;
                }

                m_steps.setResult(*IDX, STEP_RESULT_COMPLETED);
                m_steps.onUpdateFinished();
                setInfo("Installation complete! Reboot to finish setup.");
                if (onStep(STEP_UPDATE))
                    advanceToNextStep();
            }
        },
        msg);
}

void COnboard::finishTaskList() {
    m_executing = false;
    m_simulation.stop();
}

void COnboard::onExternalReturned(const std::expected<int, std::string>& result, const std::string& program) {
    if (!result)
        setError(std::format("Failed to launch {}: {}", program, result.error()));
    else if (*result != 0)
        setError(std::format("{} exited with code {}", program, *result));

    m_network.probeNow();

    if (!m_network.connected()) {
        if (result && *result == 0)
            setError("Still not connected");
        return;
    }

    if (const auto IDX = m_steps.indexOf(STEP_NETWORK); IDX) {
        m_steps.setResult(*IDX, STEP_RESULT_COMPLETED);
        setInfo("Network connected");
        if (onStep(STEP_NETWORK))
            advanceToNextStep();
    }
}

void COnboard::waitIdle() {
    m_runner.wait();
}

size_t COnboard::failedTaskCount() const {
    return sc<size_t>(std::ranges::count_if(m_tasks, [](const auto& t) { return t.state == TASK_FAILED; }));
}

bool COnboard::onStep(eStepId id) const {
    return m_steps.item(m_selected).id == id;
}

eStepId COnboard::currentStepId() const {
    return m_steps.item(m_selected).id;
}

void COnboard::setError(std::string text) {
    m_message = SStatusMessage{.text = std::move(text), .isError = true};
}

void COnboard::setInfo(std::string text) {
    m_message = SStatusMessage{.text = std::move(text), .isError = false};
}

//
int COnboard::wakeFd() const {
    return m_channel.wakeFd();
}

bool COnboard::shouldExit() const {
    return m_shouldExit;
}

const SOnboardConfig& COnboard::config() const {
    return m_config;
}

const CStepSequence& COnboard::steps() const {
    return m_steps;
}

size_t COnboard::selectedStep() const {
    return m_selected;
}

ePanelFocus COnboard::panel() const {
    return m_panel;
}

eContentFocus COnboard::contentFocus() const {
    return m_contentFocus;
}

eUserField COnboard::userField() const {
    return m_userField;
}

const CModalEditor& COnboard::editor() const {
    return m_editor;
}

const CTextBuffer& COnboard::username() const {
    return m_username;
}

const CTextBuffer& COnboard::password() const {
    return m_password;
}

const CTextBuffer& COnboard::passwordConfirm() const {
    return m_passwordConfirm;
}

const CTextBuffer& COnboard::sudoPassword() const {
    return m_sudoPassword;
}

const CTextBuffer& COnboard::pickerFilter() const {
    return m_pickerFilter;
}

std::vector<std::string> COnboard::filteredPickerItems() const {
    if (m_pickerFilter.empty())
        return m_pickerItems;

    std::vector<std::string> out;
    for (const auto& i : m_pickerItems) {
        if (Text::containsInsensitive(i, m_pickerFilter.content()))
            out.emplace_back(i);
    }
    return out;
}

size_t COnboard::pickerSelected() const {
    return m_pickerSelected;
}

const std::vector<STaskStatus>& COnboard::tasks() const {
    return m_tasks;
}

std::optional<eStepId> COnboard::taskStep() const {
    return m_taskStep;
}

bool COnboard::executing() const {
    return m_executing;
}

const std::optional<SStatusMessage>& COnboard::message() const {
    return m_message;
}

std::optional<eConfirmAction> COnboard::confirmAction() const {
    return m_confirm;
}

bool COnboard::showHelp() const {
    return m_showHelp;
}

bool COnboard::setupStarted() const {
    return m_setupStarted;
}

bool COnboard::setupComplete() const {
    return m_setupComplete;
}

bool COnboard::networkConnected() const {
    return m_network.connected();
}

bool COnboard::sudoNeeded() const {
    return !dryrun() && m_selection.needsSudo();
}

const CPackageSelection& COnboard::selection() const {
    return m_selection;
}

const std::optional<std::string>& COnboard::selectedLocale() const {
    return m_selectedLocale;
}

const std::optional<std::string>& COnboard::selectedKeyboard() const {
    return m_selectedKeyboard;
}

const std::optional<std::string>& COnboard::selectedTimezone() const {
    return m_selectedTimezone;
}

const std::optional<std::string>& COnboard::createdUsername() const {
    return m_createdUsername;
}

char COnboard::spinnerChar() const {
    constexpr char SPINNER[] = {'|', '/', '-', '\\'};
    return SPINNER[m_spinner];
}

bool COnboard::dryrun() const {
    return m_config.general.dryrun;
}
