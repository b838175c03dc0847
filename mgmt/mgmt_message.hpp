// ==========================================================================
//  Вспомогательные функции для сообщений обмена PropertyRequest/PropertyResponse
// ==========================================================================
#pragma once
#ifndef MGMT_MESSAGE_HPP
#define MGMT_MESSAGE_HPP

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <string>

#include "proto/mgmt.pb.h"

#include "mgmt_error.hpp"
#include "mgmt_description.hpp"

namespace mgmt {

// Запросы к свойствам интерфейсного объекта
void make_property_read(KNXMGMT::PropertyRequest&, int object_index, int pid, int start, int count);
void make_property_write(KNXMGMT::PropertyRequest&, int object_index, int pid, int start, int count,
                         const std::string&);
void make_description_read(KNXMGMT::PropertyRequest&, int object_index, int pid);
void make_description_read_by_index(KNXMGMT::PropertyRequest&, int object_index, int property_index);
void make_authorize(KNXMGMT::PropertyRequest&, const std::string& key);
// Уведомления об установлении и разрыве соединения
void make_notice(KNXMGMT::PropertyRequest&, KNXMGMT::ServiceCode);

// Перевести код завершения ответа в код ошибки
Error response_status(const KNXMGMT::PropertyResponse&);

// Описание свойства из ответа. Отсутствующие поля:
// тип объекта и PDT равны -1, уровни доступа и количество элементов - 0.
Description to_description(const KNXMGMT::PropertyDescription&);

const char* service_name(int);

} // namespace mgmt

#endif
