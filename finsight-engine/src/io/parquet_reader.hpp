#ifndef FINSIGHT_PARQUET_READER_HPP
#define FINSIGHT_PARQUET_READER_HPP

#include "../ledger.hpp"
#include <string>
#include <vector>

namespace finsight {

class ParquetReader {
public:
    /**
     * Load transactions from a Parquet file.
     *
     * Expected schema:
     *   - id: string
     *   - date: date32, timestamp or string ("YYYY-MM-DD")
     *   - type: string ("income", "expense", "transfer")
     *   - amount: float64
     *   - currency: string
     *   - account_id: string
     *   - Optional: category, subcategory, target_account_id, description (string),
     *     converted_amount (float64, nullable)
     *
     * @param filepath Path to Parquet file
     * @return Transactions in file order
     * @throws std::runtime_error if the file cannot be read or the schema is invalid,
     *         or when the library was built without Apache Arrow
     */
    static std::vector<Transaction> load_transactions(const std::string& filepath);

    // True when Parquet support was compiled in
    static bool available();
};

} // namespace finsight

#endif // FINSIGHT_PARQUET_READER_HPP
