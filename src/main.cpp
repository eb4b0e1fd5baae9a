/**
 * @file main.cpp
 * @brief FlyLink Firmware - Main Application
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * BLE central client for a FlySight sensor:
 * - Scans for FlySight advertisements and bonded devices
 * - Lists remote directories and downloads files (stop-and-wait)
 * - Sends start/cancel timing commands and reports start results
 *
 * Operated from the USB serial console (type HELP).
 */

#include <Arduino.h>
#include "config.h"
#include "types.h"
#include "event_queue.h"
#include "timer_scheduler.h"
#include "bluefruit_transport.h"
#include "internal_fs_bond_store.h"
#include "connection_controller.h"

// =============================================================================
// GLOBAL INSTANCES
// =============================================================================

BluefruitTransport transport;
InternalFsBondStore bondStore;
ConnectionController controller;

// =============================================================================
// STATE VARIABLES
// =============================================================================

bool bleReady = false;

// Last progress decile printed for the active download
static int8_t lastProgressDecile = -1;

// =============================================================================
// FUNCTION DECLARATIONS
// =============================================================================

void printBanner();
void printHelp();
void handleSerialCommand(const char *command);

// Callbacks
void onStateObserved(ObservedChange change);
void onTimingChange(const TimingTransition &transition);
void onTimingResult(const UtcTimestamp &result, void *context);
void onDownloadComplete(TransferOutcome outcome, const std::vector<uint8_t> &data, void *context);

// =============================================================================
// SETUP
// =============================================================================

void setup()
{
    Serial.begin(SERIAL_BAUD);

    // Wait for serial with timeout
    uint32_t serialWaitStart = millis();
    while (!Serial && (millis() - serialWaitStart < 3000))
    {
        delay(10);
    }

    printBanner();

    Serial.println(F("\n--- Bond Store Initialization ---"));
    if (!bondStore.begin())
    {
        Serial.println(F("[BOND] WARNING: Bonds will not persist"));
    }

    Serial.println(F("\n--- Controller Initialization ---"));
    controller.begin(&transport, &bondStore, &scheduler);
    controller.addObserver(onStateObserved);
    controller.timing().onStateChange(onTimingChange);
    controller.timing().setResultCallback(onTimingResult, nullptr);

    eventQueue.setExecutor(ConnectionController::dispatchEvent, &controller);

    Serial.println(F("\n--- BLE Initialization ---"));
    bleReady = transport.begin(&eventQueue);
    if (!bleReady)
    {
        Serial.println(F("[BLE] ERROR: Initialization failed"));
    }

    Serial.println(F("\n[BOOT] Ready. Type HELP for commands."));
}

// =============================================================================
// LOOP
// =============================================================================

void loop()
{
    // Transport events staged by Bluefruit callbacks
    eventQueue.processAll();

    // Disappearance and receive timeouts
    scheduler.update();

    if (Serial.available())
    {
        String input = Serial.readStringUntil('\n');
        input.trim();
        if (input.length() > 0)
        {
            Serial.printf("[CMD] %s\n", input.c_str());
            handleSerialCommand(input.c_str());
        }
    }

    if (eventQueue.getDroppedCount() > 0)
    {
        static uint32_t lastReportedDrops = 0;
        uint32_t drops = eventQueue.getDroppedCount();
        if (drops != lastReportedDrops)
        {
            Serial.printf("[EVENT] WARNING: %lu event(s) dropped\n", (unsigned long)drops);
            lastReportedDrops = drops;
        }
    }

    delay(1);
}

// =============================================================================
// CONSOLE
// =============================================================================

void printBanner()
{
    Serial.println(F("\n"));
    Serial.println(F("+============================================================+"));
    Serial.println(F("|                    FlyLink Firmware                        |"));
    Serial.println(F("+============================================================+"));
    Serial.printf("|  Firmware: %-47s |\n", FIRMWARE_VERSION);
    Serial.println(F("|  Platform: Adafruit Feather nRF52840 Express              |"));
    Serial.println(F("+============================================================+"));
}

void printHelp()
{
    Serial.println(F("Commands:"));
    Serial.println(F("  SCAN                 restart scanning"));
    Serial.println(F("  DEVICES              list devices, strongest first"));
    Serial.println(F("  CONNECT <id|#>       connect (and bond)"));
    Serial.println(F("  DISCONNECT [id|#]    disconnect"));
    Serial.println(F("  UNBOND <id|#>        forget a bonded device"));
    Serial.println(F("  BONDS                list bonded identifiers"));
    Serial.println(F("  LS                   print current listing"));
    Serial.println(F("  REFRESH              re-list current directory"));
    Serial.println(F("  CD <name>            enter directory"));
    Serial.println(F("  UP                   parent directory"));
    Serial.println(F("  GET <name>           download file"));
    Serial.println(F("  ABORT                cancel download"));
    Serial.println(F("  START / CANCEL       start timer control"));
    Serial.println(F("  STATS                last download statistics"));
    Serial.println(F("  VERBOSE ON|OFF       per-packet transfer logging"));
    Serial.println(F("  STATUS               connection summary"));
    Serial.println(F("  GET_VER              firmware version"));
}

/**
 * @brief Resolve "<identifier>" or "<index>" (1-based, as printed by DEVICES)
 */
static const char *resolveDevice(const char *arg)
{
    const DeviceRegistry &registry = controller.getRegistry();

    if (arg && arg[0] != '\0' && strchr(arg, ':') == nullptr)
    {
        int index = atoi(arg);
        if (index >= 1 && index <= registry.count())
        {
            return registry.at(static_cast<uint8_t>(index - 1)).identifier;
        }
        return nullptr;
    }
    return arg;
}

/**
 * @brief Argument text after a command keyword, leading spaces skipped
 */
static const char *argumentOf(const char *command, size_t keywordLength)
{
    const char *arg = command + keywordLength;
    while (*arg == ' ')
    {
        arg++;
    }
    return arg;
}

static bool commandIs(const char *command, const char *keyword)
{
    size_t length = strlen(keyword);
    return strncasecmp(command, keyword, length) == 0 &&
           (command[length] == '\0' || command[length] == ' ');
}

void handleSerialCommand(const char *command)
{
    if (commandIs(command, "HELP"))
    {
        printHelp();
        return;
    }

    if (commandIs(command, "GET_VER"))
    {
        Serial.printf("VER:%s\n", FIRMWARE_VERSION);
        return;
    }

    if (commandIs(command, "SCAN"))
    {
        controller.startScan();
        return;
    }

    if (commandIs(command, "DEVICES"))
    {
        controller.sortDevicesBySignal();
        controller.getRegistry().printDevices();
        return;
    }

    if (commandIs(command, "CONNECT"))
    {
        const char *id = resolveDevice(argumentOf(command, 7));
        if (!id || !controller.connect(id))
        {
            Serial.println(F("[ERROR] Connect failed. Use: CONNECT <id|#>"));
        }
        return;
    }

    if (commandIs(command, "DISCONNECT"))
    {
        const char *arg = argumentOf(command, 10);
        const char *id = (arg[0] != '\0') ? resolveDevice(arg) : controller.getConnectedIdentifier();
        if (!id || id[0] == '\0' || !controller.disconnect(id))
        {
            Serial.println(F("[ERROR] Disconnect failed"));
        }
        return;
    }

    if (commandIs(command, "UNBOND"))
    {
        const char *id = resolveDevice(argumentOf(command, 6));
        if (!id || !controller.unbond(id))
        {
            Serial.println(F("[ERROR] Not bonded"));
        }
        return;
    }

    if (commandIs(command, "BONDS"))
    {
        Serial.printf("[BOND] %u bonded device(s)\n", (unsigned)controller.getBonds().size());
        for (const std::string &id : controller.getBonds())
        {
            Serial.printf("  %s\n", id.c_str());
        }
        return;
    }

    if (commandIs(command, "LS"))
    {
        controller.getListing().printListing();
        return;
    }

    if (commandIs(command, "REFRESH"))
    {
        if (!controller.refreshListing())
        {
            Serial.println(F("[ERROR] REFRESH rejected"));
        }
        return;
    }

    if (commandIs(command, "CD"))
    {
        if (!controller.changeDirectory(argumentOf(command, 2)))
        {
            Serial.println(F("[ERROR] CD rejected"));
        }
        return;
    }

    if (commandIs(command, "UP"))
    {
        if (!controller.goUp())
        {
            Serial.println(F("[ERROR] UP rejected"));
        }
        return;
    }

    if (commandIs(command, "GET"))
    {
        lastProgressDecile = -1;
        controller.downloadFile(argumentOf(command, 3), onDownloadComplete, nullptr);
        return;
    }

    if (commandIs(command, "ABORT"))
    {
        if (!controller.cancelDownload())
        {
            Serial.println(F("[ERROR] No download in progress"));
        }
        return;
    }

    if (commandIs(command, "START"))
    {
        if (!controller.sendStartCommand())
        {
            Serial.println(F("[ERROR] START failed"));
        }
        return;
    }

    if (commandIs(command, "CANCEL"))
    {
        if (!controller.sendCancelCommand())
        {
            Serial.println(F("[ERROR] CANCEL failed"));
        }
        return;
    }

    if (commandIs(command, "STATS"))
    {
        controller.getTransfer().getStats().printReport();
        return;
    }

    if (commandIs(command, "VERBOSE"))
    {
        const char *arg = argumentOf(command, 7);
        if (strcasecmp(arg, "ON") == 0)
        {
            controller.transfer().setVerbose(true);
            controller.timing().setVerbose(true);
        }
        else if (strcasecmp(arg, "OFF") == 0)
        {
            controller.transfer().setVerbose(false);
            controller.timing().setVerbose(false);
        }
        else
        {
            Serial.println(F("[ERROR] Use: VERBOSE ON|OFF"));
            return;
        }
        Serial.printf("[XFER] Verbose %s\n", controller.getTransfer().isVerbose() ? "on" : "off");
        return;
    }

    if (commandIs(command, "STATUS"))
    {
        controller.printStatus();
        Serial.printf("  Events:     %u pending, %lu dropped\n",
                      (unsigned)eventQueue.getPendingCount(),
                      (unsigned long)eventQueue.getDroppedCount());
        Serial.printf("  Timers:     %u pending\n", (unsigned)scheduler.getPendingCount());
        return;
    }

    Serial.printf("[ERROR] Unknown command: %s\n", command);
}

// =============================================================================
// CALLBACKS
// =============================================================================

void onStateObserved(ObservedChange change)
{
    switch (change)
    {
    case ObservedChange::TRANSFER_PROGRESS:
    {
        int8_t decile = static_cast<int8_t>(controller.getTransfer().getProgress() * 10.0f);
        if (decile != lastProgressDecile)
        {
            lastProgressDecile = decile;
            Serial.printf("[XFER] %d%%\n", decile * 10);
        }
        break;
    }

    case ObservedChange::PATH:
        Serial.printf("[DIR] Path: %s\n", controller.getListing().getPathString().c_str());
        break;

    default:
        break;
    }
}

void onTimingChange(const TimingTransition &transition)
{
    if (transition.toState == TimingState::COUNTING)
    {
        Serial.println(F("[TIMING] Counting down..."));
    }
}

void onTimingResult(const UtcTimestamp &result, void *context)
{
    (void)context;
    char stamp[32];
    result.format(stamp, sizeof(stamp));
    Serial.println(F("+============================================================+"));
    Serial.printf("|  START: %-50s |\n", stamp);
    Serial.println(F("+============================================================+"));
}

void onDownloadComplete(TransferOutcome outcome, const std::vector<uint8_t> &data, void *context)
{
    (void)context;

    if (outcome != TransferOutcome::SUCCESS)
    {
        Serial.printf("[XFER] Download ended: %s (%u bytes)\n",
                      transferOutcomeToString(outcome), (unsigned)data.size());
        return;
    }

    Serial.printf("[XFER] Download complete: %u bytes\n", (unsigned)data.size());

    // Preview the head of the file as text
    static constexpr size_t PREVIEW_LEN = 256;
    size_t previewLength = data.size() < PREVIEW_LEN ? data.size() : PREVIEW_LEN;
    for (size_t i = 0; i < previewLength; i++)
    {
        char c = static_cast<char>(data[i]);
        Serial.print((c == '\n' || c == '\r' || c == '\t' || (c >= 0x20 && c < 0x7F)) ? c : '.');
    }
    Serial.println();
}
