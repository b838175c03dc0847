// ==========================================================================
//  Клиент доступа к свойствам интерфейсных объектов устройства.
//
//  Поверх транспорта (удаленного или локального) добавляет:
//    - преобразование значений свойств по типу точки данных (DPT),
//      найденному в определениях свойств;
//    - обход всех свойств объектов устройства (scan).
// ==========================================================================
#pragma once
#ifndef MGMT_PROPERTY_CLIENT_HPP
#define MGMT_PROPERTY_CLIENT_HPP

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

// Общесистемные заголовочные файлы
#include <functional>
#include <map>
#include <string>

// Служебные файлы KNXMGMT
#include "dpt_translator.hpp"
#include "mgmt_error.hpp"
#include "mgmt_description.hpp"
#include "mgmt_definitions.hpp"
#include "mgmt_config.hpp"
#include "mgmt_transport.hpp"

namespace mgmt {

class PropertyClient
{
  public:
    // Получатель описаний, найденных при обходе
    typedef std::function<void(const Description&)> DescriptionConsumer;

    // Клиент становится владельцем транспорта
    PropertyClient(PropertyTransport*);
   ~PropertyClient();

    // Применить конфигурацию: таймаут, источник количества объектов, файл определений
    Error configure(const ClientConfig&);

    // Добавить определения свойств. Ранее добавленные с тем же ключом заменяются.
    void add_definitions(const Definitions&);
    const Definitions& definitions() const { return m_definitions; };
    // Определение для данного типа объекта, иначе глобальное. NULL если нет ни того, ни другого.
    const PropertyDefinition* find_definition(int, int) const;

    // Свойство, количество элементов которого равно количеству объектов устройства
    void set_object_count_source(int, int);

    // Тип объекта, читается из PID_OBJECT_TYPE однократно для каждого объекта
    Error get_object_type(int, int&);

    // Значение первого элемента свойства в текстовом виде, с единицей измерения
    Error get_property(int, int, std::string&);
    // Двоичное значение count элементов начиная с start
    Error get_property(int, int, int, int, std::string&);
    // Значение count элементов начиная с start, загруженное в транслятор.
    // Освобождение транслятора возлагается на вызывающую сторону.
    Error get_property_translated(int, int, int, int, dpt::Translator*&);

    Error set_property(int, int, int, int, const std::string&);
    // Записать значение, заданное текстом, начиная с элемента start
    Error set_property(int, int, int, const std::string&);

    Error get_description(int, int, Description&);
    Error get_description_by_index(int, int, Description&);

    // Обход свойств всех объектов устройства либо одного объекта.
    // authorized - предварительно авторизоваться ключом транспорта.
    Error scan_properties(bool, const DescriptionConsumer&);
    Error scan_properties(int, bool, const DescriptionConsumer&);

    PropertyTransport* transport() const { return m_transport; };
    bool is_open() const { return m_transport->is_open(); };
    void close();

    // Название типа объекта, пустая строка для неизвестных типов
    static std::string object_type_name(int);
    // DPT по умолчанию для типа данных свойства, пустая строка если такого нет
    static std::string dpt_by_pdt(int);

  private:
    DISALLOW_COPY_AND_ASSIGN(PropertyClient);
    Error resolve_dpt(int, int, std::string&);
    bool  has_specific_definition(int) const;
    Error prepare_scan(bool);
    Error object_count(int&);
    Error scan_object(int, const DescriptionConsumer&, bool&);
    void  deliver(const DescriptionConsumer&, const Description&);

    PropertyTransport *m_transport;
    Definitions        m_definitions;
    // Кеш типов объектов по индексу объекта
    std::map<int, int> m_object_types;
    int                m_count_object_index;
    int                m_count_pid;
};

} // namespace mgmt

#endif
