#include "SupervisorConfig.hpp"

#include "SimpleIni.h"

namespace hb {
namespace {
bool readInt(CSimpleIniA& ini, const char* section, const char* key,
             int* value) {
  const char* raw = ini.GetValue(section, key, NULL);
  if (!raw) {
    return true;
  }
  try {
    *value = stoi(raw);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Invalid value for [" << section << "] " << key << ": "
               << raw;
    return false;
  }
  return true;
}

bool readMillis(CSimpleIniA& ini, const char* section, const char* key,
                chrono::milliseconds* value) {
  int ms = int(value->count());
  if (!readInt(ini, section, key, &ms)) {
    return false;
  }
  if (ms < 0) {
    LOG(ERROR) << "Negative duration for [" << section << "] " << key;
    return false;
  }
  *value = chrono::milliseconds(ms);
  return true;
}

bool readSize(CSimpleIniA& ini, const char* section, const char* key,
              size_t* value) {
  int size = int(*value);
  if (!readInt(ini, section, key, &size)) {
    return false;
  }
  if (size <= 0) {
    LOG(ERROR) << "Size must be positive for [" << section << "] " << key;
    return false;
  }
  *value = size_t(size);
  return true;
}

void readString(CSimpleIniA& ini, const char* section, const char* key,
                string* value) {
  const char* raw = ini.GetValue(section, key, NULL);
  if (raw) {
    *value = trim(raw);
  }
}

bool applyIni(CSimpleIniA& ini, SupervisorConfig* config) {
  bool ok = true;

  ok = readInt(ini, "Ports", "base", &config->ports.base) && ok;
  ok = readInt(ini, "Ports", "end", &config->ports.end) && ok;
  ok = readInt(ini, "Ports", "max_probes", &config->ports.maxProbes) && ok;
  int probe = config->ports.probe ? 1 : 0;
  ok = readInt(ini, "Ports", "probe", &probe) && ok;
  config->ports.probe = probe != 0;
  const char* reserved = ini.GetValue("Ports", "reserved", NULL);
  if (reserved) {
    config->ports.reserved.clear();
    for (const auto& token : split(reserved, ',')) {
      string port = trim(token);
      if (port.empty()) {
        continue;
      }
      try {
        config->ports.reserved.insert(stoi(port));
      } catch (const std::exception& e) {
        LOG(ERROR) << "Invalid reserved port: " << port;
        ok = false;
      }
    }
  }
  if (config->ports.base <= 0 || config->ports.end > 65535 ||
      config->ports.base > config->ports.end) {
    LOG(ERROR) << "Invalid port range " << config->ports.base << "-"
               << config->ports.end;
    ok = false;
  }

  readString(ini, "DevServer", "command", &config->devServer.command);
  readString(ini, "DevServer", "host", &config->devServer.host);
  const char* readiness = ini.GetValue("DevServer", "readiness", NULL);
  if (readiness) {
    config->devServer.readinessPatterns.clear();
    for (const auto& token : split(readiness, ',')) {
      string pattern = trim(token);
      if (!pattern.empty()) {
        config->devServer.readinessPatterns.push_back(pattern);
      }
    }
  }
  ok = readMillis(ini, "DevServer", "readiness_timeout_ms",
                  &config->devServer.readinessTimeout) &&
       ok;
  ok = readMillis(ini, "DevServer", "grace_ms", &config->devServer.grace) &&
       ok;
  ok = readSize(ini, "DevServer", "error_tail_bytes",
                &config->devServer.errorTailBytes) &&
       ok;

  readString(ini, "Session", "shell", &config->session.shell);
  ok = readMillis(ini, "Session", "grace_ms", &config->session.grace) && ok;
  ok = readInt(ini, "Session", "rows", &config->session.rows) && ok;
  ok = readInt(ini, "Session", "cols", &config->session.cols) && ok;

  ok = readMillis(ini, "Broker", "coalesce_ms",
                  &config->broker.coalesceWindow) &&
       ok;
  ok = readMillis(ini, "Broker", "input_pause_ms", &config->broker.inputPause) &&
       ok;
  ok = readSize(ini, "Broker", "max_batch_bytes",
                &config->broker.maxBatchBytes) &&
       ok;
  ok = readSize(ini, "Broker", "max_buffered_bytes",
                &config->broker.maxBufferedBytes) &&
       ok;

  ok = readInt(ini, "Debug", "verbose", &config->debug.verbose) && ok;
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    config->debug.logsize = string(logsize);
  }
  const char* silent = ini.GetValue("Debug", "silent", NULL);
  if (silent) {
    config->debug.silent = atoi(silent) != 0;
  }
  return ok;
}
}  // namespace

bool SupervisorConfig::loadFromIni(const string& filename) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    LOG(ERROR) << "Invalid config file: " << filename;
    return false;
  }
  return applyIni(ini, this);
}

bool SupervisorConfig::loadFromString(const string& iniText) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(iniText.c_str(), iniText.size());
  if (rc < 0) {
    LOG(ERROR) << "Invalid config data";
    return false;
  }
  return applyIni(ini, this);
}

string SessionConfig::resolveShell() const {
  if (!shell.empty()) {
    return shell;
  }
  const char* envShell = ::getenv("SHELL");
  if (envShell && envShell[0] != '\0') {
    return string(envShell);
  }
  return "/bin/sh";
}
}  // namespace hb
