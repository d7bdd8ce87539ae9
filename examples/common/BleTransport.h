/**
 * @file BleTransport.h
 * @brief NimBLE-based GATT transport adapter for CometBlue examples.
 *
 * This file provides connect/read/write callbacks backed by a
 * NimBLEClient. The library does not depend on NimBLE directly;
 * this adapter bridges them.
 *
 * NOT part of the library API. Example-only.
 *
 * @note Written against NimBLE-Arduino 1.4.x.
 */

#pragma once

#include <Arduino.h>
#include <NimBLEDevice.h>

#include <cstring>

#include "CometBlue/Status.h"

namespace transport {

/// @brief Vendor service holding the thermostat characteristics
static constexpr const char* COMETBLUE_SERVICE_UUID = "47e90001-47e9-11e4-8939-164230d1df67";
/// @brief Generic Access service (device name)
static constexpr const char* GAP_SERVICE_UUID = "00001800-0000-1000-8000-00805f9b34fb";
/// @brief Device Information service (model, revisions, manufacturer)
static constexpr const char* DEVICE_INFO_SERVICE_UUID = "0000180a-0000-1000-8000-00805f9b34fb";

/**
 * @brief Pick the service that owns a characteristic.
 *
 * 0x2a00 is in Generic Access, the other 0x2axx strings in Device
 * Information, everything else in the vendor service.
 */
inline const char* serviceFor(const char* charUuid) {
  if (std::strncmp(charUuid, "00002a00", 8) == 0) {
    return GAP_SERVICE_UUID;
  }
  if (std::strncmp(charUuid, "00002a", 6) == 0) {
    return DEVICE_INFO_SERVICE_UUID;
  }
  return COMETBLUE_SERVICE_UUID;
}

inline NimBLERemoteCharacteristic* findCharacteristic(NimBLEClient* client, const char* uuid) {
  NimBLERemoteService* svc = client->getService(NimBLEUUID(serviceFor(uuid)));
  if (svc == nullptr) {
    return nullptr;
  }
  return svc->getCharacteristic(NimBLEUUID(uuid));
}

/**
 * @brief Connect to the thermostat.
 *
 * Pass to Config::connect, and pass a NimBLEClient* to transportUser.
 *
 * @param address MAC address "XX:XX:XX:XX:XX:XX"
 * @param timeoutMs Connect timeout (rounded up to whole seconds)
 * @param user Pointer to NimBLEClient
 * @return Status OK on success, NOT_CONNECTED on failure
 */
inline CometBlue::Status bleConnect(const char* address, uint32_t timeoutMs, void* user) {
  NimBLEClient* client = static_cast<NimBLEClient*>(user);
  if (client == nullptr) {
    return CometBlue::Status::Error(CometBlue::Err::INVALID_CONFIG, "NimBLE client is null");
  }
  if (address == nullptr) {
    return CometBlue::Status::Error(CometBlue::Err::INVALID_PARAM, "Address is null");
  }
  if (client->isConnected()) {
    return CometBlue::Status::Ok();
  }

  client->setConnectTimeout(static_cast<uint8_t>((timeoutMs + 999u) / 1000u));
  // Comet Blue advertises with a public address
  if (!client->connect(NimBLEAddress(std::string(address), BLE_ADDR_PUBLIC))) {
    return CometBlue::Status::Error(CometBlue::Err::NOT_CONNECTED, "BLE connect failed");
  }
  return CometBlue::Status::Ok();
}

/**
 * @brief Disconnect from the thermostat. Safe when not connected.
 */
inline CometBlue::Status bleDisconnect(void* user) {
  NimBLEClient* client = static_cast<NimBLEClient*>(user);
  if (client == nullptr) {
    return CometBlue::Status::Error(CometBlue::Err::INVALID_CONFIG, "NimBLE client is null");
  }
  if (!client->isConnected()) {
    return CometBlue::Status::Ok();
  }
  const int rc = client->disconnect();
  if (rc != 0) {
    return CometBlue::Status::Error(CometBlue::Err::TRANSPORT_ERROR, "BLE disconnect failed", rc);
  }
  return CometBlue::Status::Ok();
}

/**
 * @brief Read a characteristic value.
 *
 * Pass to Config::read.
 *
 * @param uuid Characteristic UUID (lowercase, 36 chars)
 * @param rx Destination buffer
 * @param rxCap Capacity of rx
 * @param[out] rxLen Number of bytes read
 * @param timeoutMs Unused (NimBLE uses its own ATT timeout)
 * @param user Pointer to NimBLEClient
 */
inline CometBlue::Status bleRead(const char* uuid, uint8_t* rx, size_t rxCap, size_t* rxLen,
                                 uint32_t timeoutMs, void* user) {
  (void)timeoutMs;
  NimBLEClient* client = static_cast<NimBLEClient*>(user);
  if (client == nullptr) {
    return CometBlue::Status::Error(CometBlue::Err::INVALID_CONFIG, "NimBLE client is null");
  }
  if (uuid == nullptr || rx == nullptr || rxLen == nullptr) {
    return CometBlue::Status::Error(CometBlue::Err::INVALID_PARAM, "Invalid BLE read params");
  }
  if (!client->isConnected()) {
    return CometBlue::Status::Error(CometBlue::Err::TRANSPORT_ERROR, "BLE link lost");
  }

  NimBLERemoteCharacteristic* chr = findCharacteristic(client, uuid);
  if (chr == nullptr) {
    return CometBlue::Status::Error(CometBlue::Err::TRANSPORT_ERROR, "Characteristic not found");
  }
  if (!chr->canRead()) {
    return CometBlue::Status::Error(CometBlue::Err::TRANSPORT_ERROR, "Characteristic not readable");
  }

  NimBLEAttValue value = chr->readValue();
  if (!client->isConnected()) {
    return CometBlue::Status::Error(CometBlue::Err::TIMEOUT, "BLE read timed out");
  }
  if (value.length() > rxCap) {
    return CometBlue::Status::Error(CometBlue::Err::MALFORMED_DATA, "BLE value exceeds buffer",
                                    static_cast<int32_t>(value.length()));
  }
  std::memcpy(rx, value.data(), value.length());
  *rxLen = value.length();
  return CometBlue::Status::Ok();
}

/**
 * @brief Write a characteristic value with response.
 *
 * Pass to Config::write. The device rejects writes (including a wrong
 * PIN) with an ATT error, reported here as TRANSPORT_ERROR. A link that
 * drops during the write is reported as TIMEOUT.
 */
inline CometBlue::Status bleWrite(const char* uuid, const uint8_t* data, size_t len,
                                  uint32_t timeoutMs, void* user) {
  (void)timeoutMs;
  NimBLEClient* client = static_cast<NimBLEClient*>(user);
  if (client == nullptr) {
    return CometBlue::Status::Error(CometBlue::Err::INVALID_CONFIG, "NimBLE client is null");
  }
  if (uuid == nullptr || data == nullptr || len == 0) {
    return CometBlue::Status::Error(CometBlue::Err::INVALID_PARAM, "Invalid BLE write params");
  }
  if (!client->isConnected()) {
    return CometBlue::Status::Error(CometBlue::Err::TRANSPORT_ERROR, "BLE link lost");
  }

  NimBLERemoteCharacteristic* chr = findCharacteristic(client, uuid);
  if (chr == nullptr) {
    return CometBlue::Status::Error(CometBlue::Err::TRANSPORT_ERROR, "Characteristic not found");
  }
  if (!chr->writeValue(data, len, true)) {
    if (!client->isConnected()) {
      return CometBlue::Status::Error(CometBlue::Err::TIMEOUT, "BLE write timed out");
    }
    return CometBlue::Status::Error(CometBlue::Err::TRANSPORT_ERROR, "BLE write rejected",
                                    static_cast<int32_t>(len));
  }
  return CometBlue::Status::Ok();
}

/**
 * @brief Initialize NimBLE and create the client used by the callbacks.
 *
 * @return Client pointer, nullptr on failure
 */
inline NimBLEClient* initBle() {
  NimBLEDevice::init("");
  NimBLEDevice::setPower(ESP_PWR_LVL_P9);
  NimBLEClient* client = NimBLEDevice::createClient();
  if (client != nullptr) {
    client->setConnectionParams(12, 12, 0, 200);
  }
  return client;
}

}  // namespace transport
