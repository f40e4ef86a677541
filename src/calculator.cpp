#include "calculator.hpp"
#include "errors.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fixdec {

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(field);
    }
    return fields;
}

int parse_int_operand(const std::string& text) {
    std::size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(text, &used);
    } catch (const std::invalid_argument&) {
        throw ParseError("not an integer: '" + text + "'");
    } catch (const std::out_of_range&) {
        throw ParseError("integer out of range: '" + text + "'");
    }
    if (used != text.size()) {
        throw ParseError("not an integer: '" + text + "'");
    }
    return value;
}

std::string evaluate(const DecimalEngine& engine, const std::vector<std::string>& fields) {
    if (fields.size() < 2 || fields.size() > 3) {
        throw InvalidArgumentError("expected op,a[,b] but got " + std::to_string(fields.size()) +
                                   " fields");
    }
    const std::string& op = fields[0];
    const int64_t a = engine.parse(fields[1]);

    if (fields.size() == 2) {
        if (op == "abs") {
            return engine.to_string(engine.absolute(a));
        } else if (op == "neg") {
            return engine.to_string(engine.negate(a));
        } else if (op == "inv") {
            return engine.to_string(engine.invert(a));
        } else if (op == "sqr") {
            return engine.to_string(engine.square(a));
        } else if (op == "sqrt") {
            return engine.to_string(engine.square_root(a));
        } else if (op == "tolong") {
            return std::to_string(engine.to_long(a));
        } else if (op == "todouble") {
            std::ostringstream oss;
            oss.precision(17);
            oss << engine.to_double(a);
            return oss.str();
        }
        throw InvalidArgumentError("unknown unary op: " + op);
    }

    if (op == "pow") {
        return engine.to_string(engine.power(a, parse_int_operand(fields[2])));
    } else if (op == "shl") {
        return engine.to_string(engine.shift_left(a, parse_int_operand(fields[2])));
    } else if (op == "shr") {
        return engine.to_string(engine.shift_right(a, parse_int_operand(fields[2])));
    } else if (op == "round") {
        return engine.to_string(engine.round(a, parse_int_operand(fields[2])));
    }

    const int64_t b = engine.parse(fields[2]);
    if (op == "add") {
        return engine.to_string(engine.add(a, b));
    } else if (op == "sub") {
        return engine.to_string(engine.subtract(a, b));
    } else if (op == "mul") {
        return engine.to_string(engine.multiply(a, b));
    } else if (op == "div") {
        return engine.to_string(engine.divide(a, b));
    } else if (op == "avg") {
        return engine.to_string(engine.average(a, b));
    } else if (op == "min") {
        return engine.to_string(engine.min(a, b));
    } else if (op == "max") {
        return engine.to_string(engine.max(a, b));
    }
    throw InvalidArgumentError("unknown binary op: " + op);
}

CalculatorSummary run_calculator(const DecimalEngine& engine, std::istream& input,
                                 std::ostream& out, std::ostream& err) {
    CalculatorSummary summary;
    std::string line;
    while (std::getline(input, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const std::vector<std::string> fields = split_fields(line);
        if (fields.size() < 2 || fields.size() > 3) {
            err << "expected op,a[,b] in line: " << line << "\n";
            ++summary.failed;
            continue;
        }

        try {
            const std::string result = evaluate(engine, fields);
            out << fields[0] << "(" << fields[1];
            if (fields.size() == 3) {
                out << ", " << fields[2];
            }
            out << ") = " << result << "\n";
            ++summary.evaluated;
        } catch (const std::exception& ex) {
            err << "failed to evaluate line: " << line << " error: " << ex.what() << "\n";
            ++summary.failed;
        }
    }
    return summary;
}

} // namespace fixdec
