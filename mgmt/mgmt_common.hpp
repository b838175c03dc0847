// ==============================================================
// Общие определения для доступа к свойствам интерфейсных
// объектов устройств KNX: идентификаторы свойств (PID),
// типы объектов, типы данных свойств (PDT), уровни доступа.
// ==============================================================
#pragma once
#ifndef MGMT_COMMON_HPP
#define MGMT_COMMON_HPP

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <string>

namespace mgmt {

// Идентификаторы свойств, общие для всех интерфейсных объектов
enum {
  PID_OBJECT_TYPE             = 1,
  PID_OBJECT_NAME             = 2,
  PID_LOAD_STATE_CONTROL      = 5,
  PID_RUN_STATE_CONTROL       = 6,
  PID_TABLE_REFERENCE         = 7,
  PID_SERVICE_CONTROL         = 8,
  PID_FIRMWARE_REVISION       = 9,
  PID_SERIAL_NUMBER           = 11,
  PID_MANUFACTURER_ID         = 12,
  PID_PROGRAM_VERSION         = 13,
  PID_DEVICE_CONTROL          = 14,
  PID_ORDER_INFO              = 15,
  PID_PEI_TYPE                = 16,
  PID_PORT_CONFIGURATION      = 17,
  PID_DESCRIPTION             = 21,
  PID_TABLE                   = 23,
  PID_VERSION                 = 25,
  PID_MCB_TABLE               = 27,
  PID_ERROR_CODE              = 28,
  // Свойства объекта устройства (Device Object)
  PID_ROUTING_COUNT           = 51,
  PID_MAX_RETRY_COUNT         = 52,
  PID_MAX_APDULENGTH          = 56,
  PID_SUBNET_ADDRESS          = 57,
  PID_DEVICE_ADDRESS          = 58,
  PID_IO_LIST                 = 71,
  PID_HARDWARE_TYPE           = 78,
  PID_DEVICE_DESCRIPTOR       = 83,
  // Свойства объекта параметров KNXnet/IP
  PID_PROJECT_INSTALLATION_ID = 51,
  PID_KNX_INDIVIDUAL_ADDRESS  = 52
};

// Коды типов интерфейсных объектов
enum {
  OT_DEVICE                   = 0,
  OT_ADDRESS_TABLE            = 1,
  OT_ASSOCIATION_TABLE        = 2,
  OT_APPLICATION_PROGRAM      = 3,
  OT_INTERFACE_PROGRAM        = 4,
  OT_KNX_OBJECT_ASSOCIATION_TABLE = 5,
  OT_ROUTER                   = 6,
  OT_LTE_ADDRESS_ROUTING_TABLE= 7,
  OT_CEMI_SERVER              = 8,
  OT_GROUP_OBJECT_TABLE       = 9,
  OT_POLLING_MASTER           = 10,
  OT_KNXNETIP_PARAMETER       = 11,
  OT_RESERVED                 = 12,
  OT_FILE_SERVER              = 13,
  OT_SECURITY                 = 17,
  OT_RF_MEDIUM                = 19
};

// Типы данных свойств (Property Datatype)
enum {
  PDT_UNKNOWN                 = -1,
  PDT_CONTROL                 = 0x00,
  PDT_CHAR                    = 0x01,
  PDT_UNSIGNED_CHAR           = 0x02,
  PDT_INT                     = 0x03,
  PDT_UNSIGNED_INT            = 0x04,
  PDT_KNX_FLOAT               = 0x05,
  PDT_DATE                    = 0x06,
  PDT_TIME                    = 0x07,
  PDT_LONG                    = 0x08,
  PDT_UNSIGNED_LONG           = 0x09,
  PDT_FLOAT                   = 0x0A,
  PDT_DOUBLE                  = 0x0B,
  PDT_CHAR_BLOCK              = 0x0C,
  PDT_POLL_GROUP_SETTINGS     = 0x0D,
  PDT_SHORT_CHAR_BLOCK        = 0x0E,
  PDT_DATE_TIME               = 0x0F,
  PDT_VARIABLE_LENGTH         = 0x10,
  PDT_GENERIC_01              = 0x11,
  PDT_GENERIC_02              = 0x12,
  PDT_GENERIC_03              = 0x13,
  PDT_GENERIC_04              = 0x14,
  PDT_GENERIC_05              = 0x15,
  PDT_GENERIC_06              = 0x16,
  PDT_GENERIC_07              = 0x17,
  PDT_GENERIC_08              = 0x18,
  PDT_GENERIC_10              = 0x1A,
  PDT_UTF8                    = 0x2F,
  PDT_VERSION                 = 0x30
};

// Уровни доступа: 0 - наибольшие права, 15 - свободный доступ
#define ACCESS_LEVEL_MAX        0
#define ACCESS_LEVEL_FREE       15

// Глобальное определение свойства, действует для всех типов объектов
#define OBJECT_TYPE_GLOBAL      -1

// Свойство, количество элементов которого равно количеству интерфейсных объектов
#define DEFAULT_OBJECT_COUNT_INDEX  0
#define DEFAULT_OBJECT_COUNT_PID    PID_IO_LIST

// Индекс свойства и индекс объекта передаются в устройство одним байтом
#define MAX_PROPERTY_INDEX      255
#define MAX_OBJECT_INDEX        255

// Индивидуальный адрес устройства в виде "область.линия.устройство"
std::string address_to_string(int);
// Разобрать адрес из "1.1.4" или из числа. false при ошибке формата.
bool parse_individual_address(const std::string&, int&);

} // namespace mgmt

#endif
