#pragma once
#ifndef MGMT_CONFIG_HPP
#define MGMT_CONFIG_HPP

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

// Общесистемные заголовочные файлы
#include <string>

// Служебные заголовочные файлы сторонних утилит
#include "rapidjson/document.h"

// Служебные файлы KNXMGMT
#include "mgmt_error.hpp"

#define s_COMMON              "common"        // общие параметры клиента
#define s_COMMON_TIMEOUT      "TIMEOUT"       // Таймаут ожидания ответа в миллисекундах
#define s_COMMON_TRACE        "TRACE"         // Глубина трассировки логов
#define s_REMOTE              "remote"        // доступ к удаленному устройству через шлюз
#define s_REMOTE_ENDPOINT     "ENDPOINT"
#define s_REMOTE_DEVICE       "DEVICE"        // Индивидуальный адрес "1.1.4" или число
#define s_REMOTE_CONNECTION_ORIENTED "CONNECTION_ORIENTED"
#define s_REMOTE_KEY          "KEY"           // Ключ авторизации, шестнадцатеричный
#define s_LOCAL               "local"         // доступ к локальной службе управления
#define s_LOCAL_ENDPOINT      "ENDPOINT"
#define s_SCAN                "scan"          // свойство, содержащее количество объектов
#define s_SCAN_OBJECT_INDEX   "OBJECT_INDEX"
#define s_SCAN_PID            "PID"
#define s_DEFINITIONS         "definitions"   // файл определений свойств

namespace mgmt {

// ---------------------------------------------------------
class ClientConfig
{
  public:
    ClientConfig(const std::string&);
   ~ClientConfig();

    // Загрузка конфига целиком. rtE_CONFIG, если файл не читается или содержит ошибки.
    Error load();
    // Загрузка из текста, для конфигураций, не хранящихся в файле
    Error parse(const char*);

    // COMMON
    int timeout() const         { return m_timeout; };
    int trace_level() const     { return m_trace_level; };
    // REMOTE
    const std::string& remote_endpoint() const { return m_remote_endpoint; };
    // -1, если адрес не задан
    int device_address() const  { return m_device_address; };
    bool connection_oriented() const { return m_connection_oriented; };
    // Ключ авторизации в двоичном виде, пустой если не задан
    const std::string& key() const { return m_key; };
    // LOCAL
    const std::string& local_endpoint() const { return m_local_endpoint; };
    // SCAN
    int count_object_index() const { return m_count_object_index; };
    int count_pid() const       { return m_count_pid; };
    // Путь к файлу определений свойств, относительный путь отсчитывается от каталога конфига
    const std::string& definitions_filename() const { return m_definitions_filename; };

  private:
    DISALLOW_COPY_AND_ASSIGN(ClientConfig);
    Error apply(const rapidjson::Document&);
    Error load_common(const rapidjson::Value&);
    Error load_remote(const rapidjson::Value&);
    Error load_local(const rapidjson::Value&);
    Error load_scan(const rapidjson::Value&);
    void  set_defaults();

    std::string m_config_filename;
    int         m_timeout;
    int         m_trace_level;
    std::string m_remote_endpoint;
    int         m_device_address;
    bool        m_connection_oriented;
    std::string m_key;
    std::string m_local_endpoint;
    int         m_count_object_index;
    int         m_count_pid;
    std::string m_definitions_filename;
};

} // namespace mgmt

#endif
