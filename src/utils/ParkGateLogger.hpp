/**
 * @file ParkGateLogger.hpp
 * @brief Thread-safe & non-blocking log sink for ParkGate output
 */

#pragma once

#ifndef NATIVE_TEST

#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/queue.h>
#include <freertos/event_groups.h>
#include <cstdio>
#include <cstring>
#include <utility>

#ifdef ARDUINO
    #include <Arduino.h>
#elif defined(ESP_IDF_VERSION)
    #include <driver/uart.h>
#endif

// =============================================================================
// LOG DESTINATION & CHUNK SIZE CONFIGURATION
// =============================================================================

#ifndef PARKGATE_LOG_OUTPUT
    #ifdef ARDUINO
        #define PARKGATE_LOG_OUTPUT Serial
    #elif defined(ESP_IDF_VERSION)
        #define PARKGATE_LOG_OUTPUT UART_NUM_0
    #endif
#endif

#ifndef PARKGATE_LOG_CHUNK_SIZE
    #ifdef ARDUINO
        #define PARKGATE_LOG_CHUNK_SIZE 64
    #else
        #define PARKGATE_LOG_CHUNK_SIZE 128
    #endif
#endif

#ifndef PARKGATE_LOG_FLUSH
    #ifdef ARDUINO
        #define PARKGATE_LOG_FLUSH() PARKGATE_LOG_OUTPUT.flush()
    #elif defined(ESP_IDF_VERSION)
        #define PARKGATE_LOG_FLUSH() uart_wait_tx_done(PARKGATE_LOG_OUTPUT, pdMS_TO_TICKS(500))
    #else
        #define PARKGATE_LOG_FLUSH() fflush(stdout)
    #endif
#endif

namespace ParkGate {

class Logger {

public:
    static constexpr size_t QUEUE_SIZE = 16;
    static constexpr size_t MAX_MSG_SIZE = 256;
    static constexpr UBaseType_t TASK_PRIORITY = 1;
    static constexpr uint32_t STACK_SIZE = 4096;
    static constexpr TickType_t CHECK_INTERVAL_TICKS = pdMS_TO_TICKS(100);

    static constexpr EventBits_t QUEUE_EMPTY_BIT = (1 << 0);

    struct LogMessage {
        char msg[MAX_MSG_SIZE];
    };

    // Called lazily by the first log call
    static void begin() {
        if (initialized) return;

        logQueue = xQueueCreate(QUEUE_SIZE, sizeof(LogMessage));
        queueEventGroup = xEventGroupCreate();

        #ifdef ESP_PLATFORM
        BaseType_t taskCreated = xTaskCreatePinnedToCore(
            logTask, "PGLogTask", STACK_SIZE, nullptr, TASK_PRIORITY, &logTaskHandle, 1);
        #else
        BaseType_t taskCreated = xTaskCreate(
            logTask, "PGLogTask", STACK_SIZE, nullptr, TASK_PRIORITY, &logTaskHandle);
        #endif

        if (logQueue && queueEventGroup && taskCreated == pdPASS) {
            xEventGroupSetBits(queueEventGroup, QUEUE_EMPTY_BIT);
            initialized = true;
        }
    }

    static void logln(const char* message = "") {
        char buffer[MAX_MSG_SIZE];
        if (*message == '\0') {
            strcpy(buffer, "\r\n");
        } else {
            snprintf(buffer, sizeof(buffer), "%s\r\n", message);
        }
        sendToQueue(buffer);
    }

    /* @brief printf-style log line
     * @note Output is truncated to MAX_MSG_SIZE with a "..." marker and always
     *       ends with exactly one newline
     */
    template<typename... Args>
    static void logf(const char* format, Args&&... args) {
        char buffer[MAX_MSG_SIZE];
        int len = snprintf(buffer, sizeof(buffer), format, std::forward<Args>(args)...);
        if (len < 0) return;

        if (len >= (int)MAX_MSG_SIZE) {
            len = MAX_MSG_SIZE - 1;
            buffer[len] = '\0';
            buffer[MAX_MSG_SIZE - 5] = '.';
            buffer[MAX_MSG_SIZE - 4] = '.';
            buffer[MAX_MSG_SIZE - 3] = '.';
        }

        while (len > 0 && (buffer[len - 1] == '\n' || buffer[len - 1] == '\r')) {
            buffer[--len] = '\0';
        }

        if (len < (int)MAX_MSG_SIZE - 2) {
            buffer[len] = '\n';
            buffer[len + 1] = '\0';
        } else {
            buffer[MAX_MSG_SIZE - 2] = '\n';
            buffer[MAX_MSG_SIZE - 1] = '\0';
        }

        sendToQueue(buffer);
    }

    // Block until every queued message has been written out
    static void waitQueueFlushed() {
        if (!initialized) return;
        xEventGroupWaitBits(queueEventGroup, QUEUE_EMPTY_BIT, pdFALSE, pdTRUE, portMAX_DELAY);
        PARKGATE_LOG_FLUSH();
    }

private:
    inline static bool initialized = false;
    inline static QueueHandle_t logQueue = nullptr;
    inline static TaskHandle_t logTaskHandle = nullptr;
    inline static EventGroupHandle_t queueEventGroup = nullptr;

    static void sendToQueue(const char* message) {
        if (!initialized) begin();
        if (!initialized) return;

        LogMessage msg;
        strncpy(msg.msg, message, MAX_MSG_SIZE - 1);
        msg.msg[MAX_MSG_SIZE - 1] = '\0';

        xEventGroupClearBits(queueEventGroup, QUEUE_EMPTY_BIT);
        if (xQueueSend(logQueue, &msg, 0) != pdTRUE && uxQueueMessagesWaiting(logQueue) == 0) {
            xEventGroupSetBits(queueEventGroup, QUEUE_EMPTY_BIT); // Dropped, nothing pending
        }
    }

    static void logTask(void*) {
        LogMessage msg;
        while (true) {
            if (xQueueReceive(logQueue, &msg, CHECK_INTERVAL_TICKS) == pdTRUE) {
                writeOutput(msg.msg, strlen(msg.msg));
                if (uxQueueMessagesWaiting(logQueue) == 0) {
                    xEventGroupSetBits(queueEventGroup, QUEUE_EMPTY_BIT);
                }
            }
        }
    }

// =============================================================================
// PLATFORM-SPECIFIC IMPLEMENTATIONS OF writeOutput()
// =============================================================================

    #if defined(ARDUINO)
        static void writeOutput(const char* data, size_t len) {
            while (len > 0) {
                size_t chunk = (len > PARKGATE_LOG_CHUNK_SIZE) ? PARKGATE_LOG_CHUNK_SIZE : len;
                size_t written = PARKGATE_LOG_OUTPUT.write((const uint8_t*)data, chunk);
                if (written == 0) {
                    vTaskDelay(pdMS_TO_TICKS(5)); // TX buffer full
                    continue;
                }
                data += written;
                len -= written;
            }
        }

    #elif defined(ESP_IDF_VERSION)
        static void writeOutput(const char* data, size_t len) {
            while (len > 0) {
                size_t chunk = (len > PARKGATE_LOG_CHUNK_SIZE) ? PARKGATE_LOG_CHUNK_SIZE : len;
                int written = uart_write_bytes(PARKGATE_LOG_OUTPUT, data, chunk);
                if (written <= 0) {
                    vTaskDelay(pdMS_TO_TICKS(5)); // TX buffer full
                    continue;
                }
                data += written;
                len -= written;
            }
        }

    #else
        static void writeOutput(const char* data, size_t len) {
            fwrite(data, 1, len, stdout);
        }

    #endif
};

} // namespace ParkGate

#endif // NATIVE_TEST
